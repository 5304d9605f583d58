#ifndef STOREINITIALIZER_H
#define STOREINITIALIZER_H

#include <QObject>
#include <QString>
#include <QList>

#include "storeschema.h"
#include "sync/synctypes.h"
#include "sync/syncrecord.h"

namespace LedgerSync {

class LocalStore;

/**
 * @brief Outcome of one store construction attempt
 */
struct StoreAttempt {
    LocalStore *store = nullptr;        ///< Owned by the caller on success
    ErrorKind error = ErrorKind::None;
    QString message;

    bool succeeded() const { return store != nullptr; }

    static StoreAttempt success(LocalStore *s) {
        StoreAttempt a;
        a.store = s;
        return a;
    }

    static StoreAttempt failure(ErrorKind kind, const QString &msg) {
        StoreAttempt a;
        a.error = kind;
        a.message = msg;
        return a;
    }
};

/**
 * @brief A strategy that failed before the chosen one
 */
struct StrategyFailure {
    StoreStrategyKind strategy;
    ErrorKind error;
    QString message;
};

/**
 * @brief Builds concrete stores; replaced in tests to inject faults
 */
class StoreFactory
{
public:
    virtual ~StoreFactory() = default;

    virtual StoreAttempt openDurable(const StoreSchema &schema, bool replicating) = 0;
    virtual StoreAttempt recreateDurable(const StoreSchema &schema) = 0;
    virtual StoreAttempt openMemory(const StoreSchema &schema) = 0;
};

/**
 * @brief Factory for JsonFileStore and MemoryStore
 */
class DefaultStoreFactory : public StoreFactory
{
public:
    DefaultStoreFactory(const QString &storeDirectory, const QString &containerIdentifier);

    StoreAttempt openDurable(const StoreSchema &schema, bool replicating) override;
    StoreAttempt recreateDurable(const StoreSchema &schema) override;
    StoreAttempt openMemory(const StoreSchema &schema) override;

private:
    QString m_storeDirectory;
    QString m_containerIdentifier;
};

/**
 * @brief One step of the initialization fallback chain
 */
class StoreStrategy
{
public:
    virtual ~StoreStrategy() = default;

    virtual StoreStrategyKind kind() const = 0;
    virtual StoreAttempt attempt() = 0;

    QString name() const { return storeStrategyName(kind()); }
};

/**
 * @brief Owns the process's single local store
 *
 * Never holds a null store. Parents the store, so deleting the handle
 * deletes the store.
 */
class StoreHandle : public QObject
{
    Q_OBJECT

public:
    StoreHandle(LocalStore *store,
                StoreStrategyKind strategy,
                const QList<StrategyFailure> &failures,
                QObject *parent = nullptr);

    LocalStore *store() const { return m_store; }
    StoreStrategyKind strategy() const { return m_strategy; }
    QList<StrategyFailure> failures() const { return m_failures; }

    bool isReplicating() const;
    bool isPersistent() const;

    /**
     * @brief Running on the minimal in-memory fallback
     */
    bool isDegraded() const { return m_strategy == StoreStrategyKind::InMemoryMinimal; }

private:
    LocalStore *m_store;
    StoreStrategyKind m_strategy;
    QList<StrategyFailure> m_failures;
};

/**
 * @brief Builds the local store through an ordered list of strategies
 *
 * Order, first success wins:
 *   1. durable, replicating (only when replication is preferred)
 *   2. durable, local-only
 *   3. durable recreated from scratch, local-only
 *   4. in-memory, full schema
 *   5. in-memory, minimal schema
 *
 * initialize() always returns a handle. The last strategy does not go
 * through the factory.
 */
class StoreInitializer : public QObject
{
    Q_OBJECT

public:
    /**
     * @param factory Not owned; must outlive initialize()
     */
    explicit StoreInitializer(StoreFactory *factory, QObject *parent = nullptr);

    /**
     * @brief Records saved into a store that has no categories yet
     */
    void setSeedRecords(const QList<SyncRecord> &records) { m_seedRecords = records; }

    /**
     * @brief The default strategy chain; caller owns the result
     */
    QList<StoreStrategy *> createStrategies(bool preferReplication) const;

    StoreHandle *initialize(bool preferReplication, QObject *parent = nullptr);

    /**
     * @brief Run an explicit chain; takes ownership of the strategies
     */
    StoreHandle *initialize(const QList<StoreStrategy *> &strategies, QObject *parent = nullptr);

signals:
    void logMessage(const QString &message);
    void strategyFailed(int strategy, int error, const QString &message);

private:
    StoreAttempt runStrategy(StoreStrategy *strategy);
    void seed(LocalStore *store);

    StoreFactory *m_factory;
    QList<SyncRecord> m_seedRecords;
};

} // namespace LedgerSync

#endif // STOREINITIALIZER_H
