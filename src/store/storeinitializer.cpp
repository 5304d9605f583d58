#include "storeinitializer.h"
#include "localstore.h"
#include "jsonfilestore.h"
#include "memorystore.h"
#include "model/recordkinds.h"

#include <QDebug>
#include <exception>

namespace LedgerSync {

// ========== DefaultStoreFactory ==========

DefaultStoreFactory::DefaultStoreFactory(const QString &storeDirectory,
                                         const QString &containerIdentifier)
    : m_storeDirectory(storeDirectory)
    , m_containerIdentifier(containerIdentifier)
{
}

StoreAttempt DefaultStoreFactory::openDurable(const StoreSchema &schema, bool replicating)
{
    JsonFileStore *store = new JsonFileStore(m_storeDirectory, schema);
    if (!store->open(replicating, m_containerIdentifier)) {
        StoreAttempt attempt = StoreAttempt::failure(store->lastError(), store->errorString());
        delete store;
        return attempt;
    }
    return StoreAttempt::success(store);
}

StoreAttempt DefaultStoreFactory::recreateDurable(const StoreSchema &schema)
{
    QString error;
    if (!JsonFileStore::destroy(m_storeDirectory, &error)) {
        return StoreAttempt::failure(ErrorKind::StorageError, error);
    }
    return openDurable(schema, false);
}

StoreAttempt DefaultStoreFactory::openMemory(const StoreSchema &schema)
{
    return StoreAttempt::success(new MemoryStore(schema));
}

// ========== Strategies ==========

namespace {

class DurableStrategy : public StoreStrategy
{
public:
    DurableStrategy(StoreFactory *factory, bool replicating)
        : m_factory(factory), m_replicating(replicating) {}

    StoreStrategyKind kind() const override {
        return m_replicating ? StoreStrategyKind::ReplicatedDurable
                             : StoreStrategyKind::LocalDurable;
    }

    StoreAttempt attempt() override {
        return m_factory->openDurable(StoreSchema::full(), m_replicating);
    }

private:
    StoreFactory *m_factory;
    bool m_replicating;
};

class RecreatedDurableStrategy : public StoreStrategy
{
public:
    explicit RecreatedDurableStrategy(StoreFactory *factory) : m_factory(factory) {}

    StoreStrategyKind kind() const override { return StoreStrategyKind::RecreatedDurable; }

    StoreAttempt attempt() override {
        return m_factory->recreateDurable(StoreSchema::full());
    }

private:
    StoreFactory *m_factory;
};

class InMemoryFullStrategy : public StoreStrategy
{
public:
    explicit InMemoryFullStrategy(StoreFactory *factory) : m_factory(factory) {}

    StoreStrategyKind kind() const override { return StoreStrategyKind::InMemoryFull; }

    StoreAttempt attempt() override {
        return m_factory->openMemory(StoreSchema::full());
    }

private:
    StoreFactory *m_factory;
};

class InMemoryMinimalStrategy : public StoreStrategy
{
public:
    StoreStrategyKind kind() const override { return StoreStrategyKind::InMemoryMinimal; }

    StoreAttempt attempt() override {
        return StoreAttempt::success(new MemoryStore(StoreSchema::minimal()));
    }
};

} // namespace

// ========== StoreHandle ==========

StoreHandle::StoreHandle(LocalStore *store,
                         StoreStrategyKind strategy,
                         const QList<StrategyFailure> &failures,
                         QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_strategy(strategy)
    , m_failures(failures)
{
    m_store->setParent(this);
}

bool StoreHandle::isReplicating() const
{
    return m_store->isReplicating();
}

bool StoreHandle::isPersistent() const
{
    return m_store->isPersistent();
}

// ========== StoreInitializer ==========

StoreInitializer::StoreInitializer(StoreFactory *factory, QObject *parent)
    : QObject(parent)
    , m_factory(factory)
    , m_seedRecords(Records::defaultCategories())
{
}

QList<StoreStrategy *> StoreInitializer::createStrategies(bool preferReplication) const
{
    QList<StoreStrategy *> strategies;
    if (preferReplication) {
        strategies.append(new DurableStrategy(m_factory, true));
    }
    strategies.append(new DurableStrategy(m_factory, false));
    strategies.append(new RecreatedDurableStrategy(m_factory));
    strategies.append(new InMemoryFullStrategy(m_factory));
    strategies.append(new InMemoryMinimalStrategy());
    return strategies;
}

StoreHandle *StoreInitializer::initialize(bool preferReplication, QObject *parent)
{
    return initialize(createStrategies(preferReplication), parent);
}

StoreHandle *StoreInitializer::initialize(const QList<StoreStrategy *> &strategies, QObject *parent)
{
    QList<StrategyFailure> failures;
    LocalStore *store = nullptr;
    StoreStrategyKind chosen = StoreStrategyKind::InMemoryMinimal;

    for (StoreStrategy *strategy : strategies) {
        StoreAttempt attempt = runStrategy(strategy);
        if (attempt.succeeded()) {
            store = attempt.store;
            chosen = strategy->kind();
            break;
        }

        failures.append({strategy->kind(), attempt.error, attempt.message});
        QString msg = QString("Store strategy '%1' failed: %2 (%3)")
                          .arg(strategy->name(), errorKindName(attempt.error), attempt.message);
        qWarning() << "[StoreInitializer]" << msg;
        emit logMessage(msg);
        emit strategyFailed(static_cast<int>(strategy->kind()),
                            static_cast<int>(attempt.error),
                            attempt.message);
    }
    qDeleteAll(strategies);

    if (!store) {
        // Caller supplied a chain without a terminal strategy
        QString msg = QString("%1: no store strategy succeeded, using minimal in-memory store")
                          .arg(errorKindName(ErrorKind::FatalInitialization));
        qCritical() << "[StoreInitializer]" << msg;
        emit logMessage(msg);
        failures.append({StoreStrategyKind::InMemoryMinimal, ErrorKind::FatalInitialization, msg});
        store = new MemoryStore(StoreSchema::minimal());
        chosen = StoreStrategyKind::InMemoryMinimal;
    } else if (chosen == StoreStrategyKind::InMemoryMinimal) {
        qCritical() << "[StoreInitializer]" << errorKindName(ErrorKind::FatalInitialization)
                    << "- running on the minimal in-memory store";
    }

    QString msg = QString("Local store ready: %1 (%2, %3)")
                      .arg(storeStrategyName(chosen), store->storeId(),
                           store->isReplicating() ? "replicating" : "local only");
    qInfo() << "[StoreInitializer]" << msg;
    emit logMessage(msg);

    seed(store);
    return new StoreHandle(store, chosen, failures, parent);
}

StoreAttempt StoreInitializer::runStrategy(StoreStrategy *strategy)
{
    try {
        StoreAttempt attempt = strategy->attempt();
        if (!attempt.succeeded() && attempt.error == ErrorKind::None) {
            attempt.error = ErrorKind::StorageError;
        }
        return attempt;
    } catch (const std::exception &e) {
        return StoreAttempt::failure(ErrorKind::StorageError,
                                     QString("Exception: %1").arg(QString::fromLocal8Bit(e.what())));
    } catch (...) {
        return StoreAttempt::failure(ErrorKind::StorageError, "Unknown exception");
    }
}

void StoreInitializer::seed(LocalStore *store)
{
    if (m_seedRecords.isEmpty()) {
        return;
    }
    if (!store->schema().contains(Records::Category) || store->recordCount(Records::Category) > 0) {
        return;
    }
    // Tombstoned defaults mean the user deleted them; don't bring them back
    for (const SyncRecord &record : std::as_const(m_seedRecords)) {
        if (store->record(record.kind, record.id).isValid()) {
            continue;
        }
        if (!store->save(record)) {
            qWarning() << "[StoreInitializer] Failed to seed" << record.description();
        }
    }
    qDebug() << "[StoreInitializer] Seeded" << m_seedRecords.size() << "default records";
}

} // namespace LedgerSync
