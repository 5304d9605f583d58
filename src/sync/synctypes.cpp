#include "synctypes.h"

namespace LedgerSync {

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None:                return "None";
        case ErrorKind::Configuration:       return "ConfigurationError";
        case ErrorKind::Account:             return "AccountError";
        case ErrorKind::TransientNetwork:    return "TransientNetworkError";
        case ErrorKind::ConflictableWrite:   return "ConflictableWriteError";
        case ErrorKind::FatalInitialization: return "FatalInitializationError";
        case ErrorKind::SchemaIncompatible:  return "SchemaIncompatible";
        case ErrorKind::StorageError:        return "StorageError";
        case ErrorKind::AlreadySubscribed:   return "AlreadySubscribed";
    }
    return "Unknown";
}

QString accountStatusDescription(AccountStatus status)
{
    switch (status) {
        case AccountStatus::Available:  return "Remote account is available";
        case AccountStatus::NoAccount:  return "Please sign in to your remote account";
        case AccountStatus::Restricted: return "Remote account is restricted";
        case AccountStatus::Unknown:    return "Unable to determine remote account status";
    }
    return QString();
}

QString syncTriggerName(SyncTrigger trigger)
{
    switch (trigger) {
        case SyncTrigger::Enablement:   return "enablement";
        case SyncTrigger::Manual:       return "manual";
        case SyncTrigger::RemoteChange: return "remote-change";
        case SyncTrigger::FollowUp:     return "follow-up";
    }
    return QString();
}

QString syncPhaseName(SyncPhase phase)
{
    switch (phase) {
        case SyncPhase::Idle:       return "idle";
        case SyncPhase::Pushing:    return "pushing";
        case SyncPhase::Pulling:    return "pulling";
        case SyncPhase::Converging: return "converging";
        case SyncPhase::Settled:    return "settled";
        case SyncPhase::TimedOut:   return "timed-out";
        case SyncPhase::Failed:     return "failed";
    }
    return QString();
}

QString storeStrategyName(StoreStrategyKind kind)
{
    switch (kind) {
        case StoreStrategyKind::ReplicatedDurable: return "durable (replicated)";
        case StoreStrategyKind::LocalDurable:      return "durable (local-only)";
        case StoreStrategyKind::RecreatedDurable:  return "durable (recreated)";
        case StoreStrategyKind::InMemoryFull:      return "in-memory (full schema)";
        case StoreStrategyKind::InMemoryMinimal:   return "in-memory (minimal schema)";
    }
    return QString();
}

QString SyncOutcome::summary() const
{
    QString text = QString("Pushed: %1, Pulled: %2, Conflicts: %3, %4")
        .arg(pushed).arg(pulled).arg(conflicts)
        .arg(converged ? "settled" : "may still be syncing");

    if (hasError()) {
        text += QString(", Error: %1").arg(errorKindName(error));
        if (!errorMessage.isEmpty()) {
            text += QString(" (%1)").arg(errorMessage);
        }
    }
    return text;
}

} // namespace LedgerSync
