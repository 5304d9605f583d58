#include "changeobserver.h"
#include "synccoordinator.h"
#include "remote/remotecollaborator.h"

#include <QDebug>
#include <QMetaObject>

namespace LedgerSync {

ChangeObserver::ChangeObserver(RemoteCollaborator *remote,
                               SyncCoordinator *coordinator,
                               QObject *parent)
    : QObject(parent)
    , m_remote(remote)
    , m_coordinator(coordinator)
{
    if (m_remote) {
        connect(m_remote, &RemoteCollaborator::notificationReceived,
                this, &ChangeObserver::onNotification);
    }
}

RemoteResult<SubscriptionDescriptor> ChangeObserver::subscribe(const QString &recordKind)
{
    using Result = RemoteResult<SubscriptionDescriptor>;

    if (!m_active || !m_remote) {
        qDebug() << "[ChangeObserver] Replication inactive, not subscribing to" << recordKind;
        return Result::success(SubscriptionDescriptor());
    }

    Result result = m_remote->subscribe(recordKind);

    if (result.error == ErrorKind::AlreadySubscribed) {
        qDebug() << "[ChangeObserver] Already subscribed to" << recordKind;
        SubscriptionDescriptor descriptor = result.value;
        if (!descriptor.isValid()) {
            descriptor.recordKind = recordKind;
            descriptor.id = recordKind.toLower() + "-updates";
        }
        result = Result::success(descriptor);
    }

    if (!result.ok()) {
        qWarning() << "[ChangeObserver] Failed to subscribe to" << recordKind
                   << errorKindName(result.error) << result.message;
        emit logMessage(QString("Change notifications for %1 unavailable: %2")
                            .arg(recordKind, result.message));
        return result;
    }

    m_subscriptions.insert(result.value.id, result.value);
    emit subscribed(recordKind);
    return result;
}

int ChangeObserver::subscribeAll(const QStringList &recordKinds)
{
    int count = 0;
    for (const QString &kind : recordKinds) {
        if (subscribe(kind).ok() && isSubscribed(kind)) {
            count++;
        }
    }
    return count;
}

void ChangeObserver::unsubscribeAll()
{
    if (!m_remote) {
        m_subscriptions.clear();
        return;
    }

    const QStringList ids = m_subscriptions.keys();
    for (const QString &id : ids) {
        RemoteResult<bool> result = m_remote->unsubscribe(id);
        if (!result.ok()) {
            qWarning() << "[ChangeObserver] Failed to remove subscription" << id << result.message;
        }
    }
    m_subscriptions.clear();
    qDebug() << "[ChangeObserver] Removed" << ids.size() << "subscription(s)";
}

bool ChangeObserver::isSubscribed(const QString &recordKind) const
{
    for (const SubscriptionDescriptor &descriptor : m_subscriptions) {
        if (descriptor.recordKind == recordKind) {
            return true;
        }
    }
    return false;
}

bool ChangeObserver::onNotification(const QVariantMap &payload)
{
    if (payload.value("type").toString() != QLatin1String("query")) {
        qDebug() << "[ChangeObserver] Ignoring non-query notification" << payload.value("type");
        return false;
    }

    const QString subscriptionId = payload.value("subscriptionId").toString();
    QString kind = payload.value("recordKind").toString();

    if (m_subscriptions.contains(subscriptionId)) {
        kind = m_subscriptions.value(subscriptionId).recordKind;
    } else if (kind.isEmpty() || !isSubscribed(kind)) {
        qDebug() << "[ChangeObserver] Ignoring notification for unknown subscription" << subscriptionId;
        return false;
    }

    if (!m_coordinator) {
        return false;
    }

    qDebug() << "[ChangeObserver] Remote change in" << kind << "- requesting sync";
    emit notificationHandled(kind);
    return QMetaObject::invokeMethod(m_coordinator, "requestRun",
                                     Qt::QueuedConnection,
                                     Q_ARG(int, static_cast<int>(SyncTrigger::RemoteChange)));
}

} // namespace LedgerSync
