#ifndef CHANGEOBSERVER_H
#define CHANGEOBSERVER_H

#include <QObject>
#include <QMap>
#include <QStringList>
#include <QVariantMap>

#include "synctypes.h"

namespace LedgerSync {

class RemoteCollaborator;
class SyncCoordinator;

/**
 * @brief Keeps remote change subscriptions and turns notifications into runs
 *
 * Subscribing is idempotent: a subscription the remote already holds is
 * treated as success. Notifications are handed to the coordinator with a
 * queued call, so the thread delivering them never waits on a run.
 */
class ChangeObserver : public QObject
{
    Q_OBJECT

public:
    ChangeObserver(RemoteCollaborator *remote,
                   SyncCoordinator *coordinator,
                   QObject *parent = nullptr);

    /**
     * @brief Whether the running store replicates
     *
     * While inactive, subscribe() succeeds without contacting the remote.
     */
    void setReplicationActive(bool active) { m_active = active; }
    bool isReplicationActive() const { return m_active; }

    RemoteResult<SubscriptionDescriptor> subscribe(const QString &recordKind);

    /**
     * @brief Subscribe to each kind
     * @return Number of kinds that ended up subscribed
     */
    int subscribeAll(const QStringList &recordKinds);

    void unsubscribeAll();

    QList<SubscriptionDescriptor> subscriptions() const { return m_subscriptions.values(); }
    bool isSubscribed(const QString &recordKind) const;

public slots:
    /**
     * @brief Handle a remote notification
     * @return true if a run was requested
     */
    bool onNotification(const QVariantMap &payload);

signals:
    void subscribed(const QString &recordKind);
    void notificationHandled(const QString &recordKind);
    void logMessage(const QString &message);

private:
    RemoteCollaborator *m_remote;
    SyncCoordinator *m_coordinator;
    bool m_active = false;
    QMap<QString, SubscriptionDescriptor> m_subscriptions;     // id -> descriptor
};

} // namespace LedgerSync

#endif // CHANGEOBSERVER_H
