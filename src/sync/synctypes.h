#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QDateTime>
#include <QList>
#include <QMap>
#include <QMetaType>

/**
 * @file synctypes.h
 * @brief Common types and enums for the replication engine
 */

namespace LedgerSync {

/**
 * @brief Error taxonomy shared by the store, the remote and the coordinator
 */
enum class ErrorKind {
    None,                   ///< No error
    Configuration,          ///< Replication unavailable (feature-off state)
    Account,                ///< No signed-in account, or restricted
    TransientNetwork,       ///< Retried on the next trigger
    ConflictableWrite,      ///< Write collided server-side, resolve and retry once
    FatalInitialization,    ///< Every store strategy failed
    SchemaIncompatible,     ///< Stored data written with another schema
    StorageError,           ///< Local storage could not be read or written
    AlreadySubscribed       ///< Remote already holds the subscription
};

/**
 * @brief Remote account state as reported by the collaborator
 */
enum class AccountStatus {
    Available,
    NoAccount,
    Restricted,
    Unknown
};

/**
 * @brief Why a coordinator run was started
 */
enum class SyncTrigger {
    Enablement,     ///< Replication switched on (or active at startup)
    Manual,         ///< User asked for a sync
    RemoteChange,   ///< Remote change notification
    FollowUp        ///< Coalesced triggers that arrived during a run
};

/**
 * @brief Coordinator state machine phases
 */
enum class SyncPhase {
    Idle,
    Pushing,
    Pulling,
    Converging,
    Settled,
    TimedOut,
    Failed
};

/**
 * @brief Store initialization strategies, in the order they are attempted
 */
enum class StoreStrategyKind {
    ReplicatedDurable = 1,  ///< Durable store, replication enabled
    LocalDurable,           ///< Durable store, local-only
    RecreatedDurable,       ///< Durable store rebuilt from scratch, local-only
    InMemoryFull,           ///< Memory-only store, full schema
    InMemoryMinimal         ///< Memory-only store, minimal schema (last resort)
};

QString errorKindName(ErrorKind kind);
QString accountStatusDescription(AccountStatus status);
QString syncTriggerName(SyncTrigger trigger);
QString syncPhaseName(SyncPhase phase);
QString storeStrategyName(StoreStrategyKind kind);

/**
 * @brief Result of a remote operation with an error kind
 *
 * Mirrors the mapper result shape: the value is only meaningful when
 * ok() returns true.
 */
template<typename T>
struct RemoteResult {
    T value;                            ///< Returned data
    ErrorKind error = ErrorKind::None;  ///< Failure kind, None on success
    QString message;                    ///< Human-readable failure detail

    bool ok() const { return error == ErrorKind::None; }

    static RemoteResult success(const T &v) {
        RemoteResult r;
        r.value = v;
        return r;
    }

    static RemoteResult failure(ErrorKind kind, const QString &msg) {
        RemoteResult r;
        r.error = kind;
        r.message = msg;
        return r;
    }
};

/**
 * @brief Interest in remote changes to one record kind
 */
struct SubscriptionDescriptor {
    QString id;             ///< Subscription id held by the remote
    QString recordKind;     ///< Record kind this subscription covers

    bool isValid() const { return !id.isEmpty(); }
};

/**
 * @brief Cheap summary of local state sampled while waiting for convergence
 */
struct StoreSummary {
    QMap<QString, int> counts;  ///< Live record count per kind
    int pendingChanges = 0;     ///< Local changes not yet pushed
    int tombstones = 0;         ///< Deleted records still tracked

    bool operator==(const StoreSummary &other) const {
        return counts == other.counts
            && pendingChanges == other.pendingChanges
            && tombstones == other.tombstones;
    }
    bool operator!=(const StoreSummary &other) const { return !(*this == other); }
};

/**
 * @brief Result of one coordinator run
 */
struct SyncOutcome {
    int pushed = 0;                     ///< Records accepted by the remote
    int pulled = 0;                     ///< Remote records applied locally
    int conflicts = 0;                  ///< Records that went through the resolver
    bool converged = false;             ///< Local state quiesced before timeout
    ErrorKind error = ErrorKind::None;
    QString errorMessage;
    SyncTrigger trigger = SyncTrigger::Manual;
    SyncPhase finalPhase = SyncPhase::Idle;
    QDateTime startTime;
    QDateTime endTime;
    QMap<QString, int> localCounts;     ///< Record counts after the run

    bool hasError() const { return error != ErrorKind::None; }

    qint64 durationMs() const {
        return startTime.msecsTo(endTime);
    }

    QString summary() const;
};

/**
 * @brief Value emitted on the status stream observed by the UI
 */
struct SyncStatus {
    enum State {
        Idle,
        Running,
        Settled,
        Failed
    };

    State state = Idle;
    SyncOutcome outcome;                ///< Valid for Settled and Failed
    ErrorKind error = ErrorKind::None;  ///< Valid for Failed

    static SyncStatus idle() { return SyncStatus(); }
    static SyncStatus running() { SyncStatus s; s.state = Running; return s; }
    static SyncStatus settled(const SyncOutcome &o) { SyncStatus s; s.state = Settled; s.outcome = o; return s; }
    static SyncStatus failed(const SyncOutcome &o) { SyncStatus s; s.state = Failed; s.outcome = o; s.error = o.error; return s; }
};

} // namespace LedgerSync

// Register types for Qt metatype system (needed for cross-thread signals)
Q_DECLARE_METATYPE(LedgerSync::SyncOutcome)
Q_DECLARE_METATYPE(LedgerSync::SyncStatus)

#endif // SYNCTYPES_H
