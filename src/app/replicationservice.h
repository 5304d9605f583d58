#ifndef REPLICATIONSERVICE_H
#define REPLICATIONSERVICE_H

#include <QObject>
#include <QString>

#include "profile.h"
#include "sync/availabilityprobe.h"
#include "sync/conflictresolver.h"
#include "sync/ticker.h"
#include "sync/synctypes.h"

class Settings;

namespace LedgerSync {

class PreferenceGate;
class StoreHandle;
class LocalStore;
class RemoteCollaborator;
class SyncCoordinator;
class ChangeObserver;

/**
 * @brief Application root for the replication engine
 *
 * Constructs every service once and hands each its dependencies:
 *
 *   Settings + AvailabilityProbe -> PreferenceGate
 *   PreferenceGate -> StoreInitializer -> StoreHandle (once, in start())
 *   StoreHandle + FolderRemote -> SyncCoordinator <- ChangeObserver
 *
 * The store's replication mode is decided in start() and stays fixed
 * until the process restarts; later preference changes only raise
 * restartRequired.
 */
class ReplicationService : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool replicationEnabled READ replicationEnabled WRITE setReplicationEnabled NOTIFY replicationEnabledChanged)
    Q_PROPERTY(bool restartRequired READ restartRequired NOTIFY restartRequiredChanged)

public:
    /**
     * @param settings Device settings, not owned
     * @param dataFolder Profile folder holding the store and config
     */
    ReplicationService(Settings *settings,
                       const QString &dataFolder,
                       QObject *parent = nullptr);
    ~ReplicationService() override;

    /**
     * @brief Remote account folder used instead of the profile's
     *
     * Must be called before start().
     */
    void setRemoteFolder(const QString &path) { m_remoteFolderOverride = path; }
    QString remoteFolder() const;

    /**
     * @brief Build the store and, when replicating, subscribe and sync
     * @param syncOnStart Trigger the enablement run right away
     */
    void start(bool syncOnStart = true);
    bool isStarted() const { return m_storeHandle != nullptr; }

    // ========== Services ==========

    Profile &profile() { return m_profile; }
    const AvailabilityProbe &availability() const { return m_probe; }
    PreferenceGate *preferences() const { return m_gate; }
    StoreHandle *storeHandle() const { return m_storeHandle; }
    LocalStore *store() const;
    RemoteCollaborator *remote() const { return m_remote; }
    SyncCoordinator *coordinator() const { return m_coordinator; }
    ChangeObserver *observer() const { return m_observer; }

    // ========== Observer Surface ==========

    bool replicationEnabled() const;
    void setReplicationEnabled(bool enabled);

    bool restartRequired() const;

    /**
     * @brief Whether the running store replicates
     */
    bool isReplicating() const;

    SyncStatus status() const;

    // ========== Records ==========

    /**
     * @brief Save a new expense dated now
     * @return Record id, empty on failure
     */
    QString addExpense(double amount,
                       const QString &notes = QString(),
                       const QString &categoryId = QString());

public slots:
    void triggerManualSync();

signals:
    void replicationEnabledChanged(bool enabled);
    void restartRequiredChanged(bool required);
    void statusChanged(const LedgerSync::SyncStatus &status);

    /**
     * @brief A run settled; carries the local counts afterwards
     */
    void syncCompleted(int expenseCount, int categoryCount);

    void logMessage(const QString &message);

private slots:
    void onRunFinished(const LedgerSync::SyncOutcome &outcome);

private:
    Settings *m_settings;
    Profile m_profile;
    AvailabilityProbe m_probe;
    ConflictResolver m_resolver;
    SteadyTicker m_ticker;
    QString m_remoteFolderOverride;

    PreferenceGate *m_gate = nullptr;
    StoreHandle *m_storeHandle = nullptr;
    RemoteCollaborator *m_remote = nullptr;
    SyncCoordinator *m_coordinator = nullptr;
    ChangeObserver *m_observer = nullptr;
};

} // namespace LedgerSync

#endif // REPLICATIONSERVICE_H
