#ifndef REMOTECOLLABORATOR_H
#define REMOTECOLLABORATOR_H

#include <QObject>
#include <QString>
#include <QList>
#include <QMap>
#include <QVariantMap>

#include "sync/synctypes.h"
#include "sync/syncrecord.h"

namespace LedgerSync {

/**
 * @brief What the remote did with a pushed batch
 *
 * On a ConflictableWrite result, accepted holds the records that were
 * committed and conflicts holds the server's current version of every
 * record that was rejected.
 */
struct PushReport {
    QList<SyncRecord> accepted;
    QList<SyncRecord> conflicts;
};

/**
 * @brief Records changed on the remote since a pull token
 */
struct PullBatch {
    QList<SyncRecord> records;
    qint64 serverToken = 0;     ///< Pass to the next pull
};

/**
 * @brief Abstract interface for the remote replication service
 *
 * The engine only talks to the remote through this class. Examples:
 *   - FolderRemote: a shared directory acting as the account
 *   - test doubles with scripted failures
 *
 * push()/pull()/recordCounts() are called from the sync worker thread;
 * subscriptions are managed from the main thread. Implementations must
 * be safe for that split.
 */
class RemoteCollaborator : public QObject
{
    Q_OBJECT

public:
    explicit RemoteCollaborator(QObject *parent = nullptr) : QObject(parent) {}
    ~RemoteCollaborator() override = default;

    // ========== Identity ==========

    /**
     * @brief Unique identifier for this remote type ("folder", ...)
     */
    virtual QString remoteId() const = 0;

    virtual AccountStatus accountStatus() = 0;

    // ========== Records ==========

    /**
     * @brief Write local versions to the remote
     *
     * A record whose marker is behind the server's copy is rejected and
     * reported as a conflict; the rest of the batch is still committed.
     */
    virtual RemoteResult<PushReport> push(const QList<SyncRecord> &records) = 0;

    /**
     * @brief Records written after sinceToken (0 = everything)
     */
    virtual RemoteResult<PullBatch> pull(qint64 sinceToken) = 0;

    /**
     * @brief Live record count per kind held by the remote
     */
    virtual RemoteResult<QMap<QString, int>> recordCounts() = 0;

    // ========== Subscriptions ==========

    /**
     * @brief Ask for notifications about changes to a record kind
     *
     * Fails with AlreadySubscribed if the remote already holds it.
     */
    virtual RemoteResult<SubscriptionDescriptor> subscribe(const QString &recordKind) = 0;

    virtual RemoteResult<bool> unsubscribe(const QString &subscriptionId) = 0;

signals:
    /**
     * @brief Change notification from the remote
     *
     * Query notifications carry "type" = "query", "subscriptionId" and
     * "recordKind".
     */
    void notificationReceived(const QVariantMap &payload);

    void errorOccurred(const QString &error);
};

} // namespace LedgerSync

#endif // REMOTECOLLABORATOR_H
