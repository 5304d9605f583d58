#include "replicationservice.h"
#include "settings.h"
#include "model/recordkinds.h"
#include "sync/preferencegate.h"
#include "sync/synccoordinator.h"
#include "sync/changeobserver.h"
#include "store/localstore.h"
#include "store/storeinitializer.h"
#include "remote/folderremote.h"

#include <QDebug>

namespace LedgerSync {

ReplicationService::ReplicationService(Settings *settings,
                                       const QString &dataFolder,
                                       QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_profile(dataFolder)
    , m_probe(m_profile.replicationConfigPath())
{
    m_gate = new PreferenceGate(m_settings, &m_probe, this);

    connect(m_gate, &PreferenceGate::enabledChanged,
            this, &ReplicationService::replicationEnabledChanged);
    connect(m_gate, &PreferenceGate::restartRequiredChanged,
            this, &ReplicationService::restartRequiredChanged);

    if (!m_probe.isAvailable()) {
        qInfo() << "[ReplicationService] Remote replication not configured for this install";
    }
}

ReplicationService::~ReplicationService()
{
    // The worker thread uses m_resolver and m_ticker; stop it first
    delete m_observer;
    m_observer = nullptr;
    delete m_coordinator;
    m_coordinator = nullptr;
}

QString ReplicationService::remoteFolder() const
{
    if (!m_remoteFolderOverride.isEmpty()) {
        return m_remoteFolderOverride;
    }
    return m_profile.remoteAccountFolder();
}

LocalStore *ReplicationService::store() const
{
    return m_storeHandle ? m_storeHandle->store() : nullptr;
}

void ReplicationService::start(bool syncOnStart)
{
    if (m_storeHandle) {
        return;
    }

    if ((!m_profile.exists() || m_profile.deviceId().isEmpty()) && !m_profile.initialize()) {
        qWarning() << "[ReplicationService] Could not initialize profile in"
                   << m_profile.dataFolderPath();
    }

    const bool preferReplication = m_gate->shouldReplicate();

    DefaultStoreFactory factory(m_profile.storeDirectoryPath(), m_probe.containerIdentifier());
    StoreInitializer initializer(&factory);
    connect(&initializer, &StoreInitializer::logMessage,
            this, &ReplicationService::logMessage);
    m_storeHandle = initializer.initialize(preferReplication, this);

    const bool replicating = m_storeHandle->isReplicating();
    m_gate->setActiveStoreMode(replicating);

    const QString folder = remoteFolder();
    if (!folder.isEmpty()) {
        m_remote = new FolderRemote(folder, m_profile.deviceId(), this);
    }

    m_coordinator = new SyncCoordinator(store(), m_remote, &m_resolver, &m_ticker, this);
    m_coordinator->setConvergenceTimeout(m_profile.convergenceTimeoutMs());
    m_coordinator->setPollInterval(m_profile.pollIntervalMs());
    m_coordinator->setStableSamples(m_profile.stableSamples());

    connect(m_coordinator, &SyncCoordinator::statusChanged,
            this, &ReplicationService::statusChanged);
    connect(m_coordinator, &SyncCoordinator::runFinished,
            this, &ReplicationService::onRunFinished);
    connect(m_coordinator, &SyncCoordinator::logMessage,
            this, &ReplicationService::logMessage);

    m_observer = new ChangeObserver(m_remote, m_coordinator, this);
    m_observer->setReplicationActive(replicating && m_remote);
    connect(m_observer, &ChangeObserver::logMessage,
            this, &ReplicationService::logMessage);

    qInfo() << "[ReplicationService] Started with"
            << storeStrategyName(m_storeHandle->strategy())
            << (replicating ? "(replicating)" : "(local only)");

    if (!replicating) {
        return;
    }
    if (!m_remote) {
        qWarning() << "[ReplicationService] Replication enabled but no remote account folder configured";
        emit logMessage("No remote account folder configured");
        return;
    }

    m_observer->subscribeAll(store()->schema().kinds());
    if (syncOnStart) {
        m_coordinator->requestRun(static_cast<int>(SyncTrigger::Enablement));
    }
}

// ========== Observer Surface ==========

bool ReplicationService::replicationEnabled() const
{
    return m_gate->isEnabled();
}

void ReplicationService::setReplicationEnabled(bool enabled)
{
    const bool wasEnabled = m_gate->isEnabled();
    m_gate->setEnabled(enabled);

    if (!m_storeHandle || wasEnabled == enabled) {
        return;
    }

    if (enabled) {
        if (isReplicating() && m_remote) {
            m_observer->setReplicationActive(true);
            m_observer->subscribeAll(store()->schema().kinds());
            m_coordinator->requestRun(static_cast<int>(SyncTrigger::Enablement));
        }
    } else {
        m_observer->unsubscribeAll();
        m_observer->setReplicationActive(false);
        m_coordinator->cancel();
    }
}

bool ReplicationService::restartRequired() const
{
    return m_gate->restartRequired();
}

bool ReplicationService::isReplicating() const
{
    return m_storeHandle && m_storeHandle->isReplicating();
}

SyncStatus ReplicationService::status() const
{
    return m_coordinator ? m_coordinator->status() : SyncStatus::idle();
}

void ReplicationService::triggerManualSync()
{
    if (!m_coordinator || !m_gate->isEnabled()) {
        emit logMessage("Replication is disabled");
        return;
    }
    m_coordinator->triggerManualSync();
}

void ReplicationService::onRunFinished(const SyncOutcome &outcome)
{
    if (outcome.finalPhase == SyncPhase::Failed) {
        return;
    }
    emit syncCompleted(outcome.localCounts.value(Records::Expense),
                       outcome.localCounts.value(Records::Category));
}

// ========== Records ==========

QString ReplicationService::addExpense(double amount,
                                       const QString &notes,
                                       const QString &categoryId)
{
    if (!store()) {
        return QString();
    }

    SyncRecord expense = Records::makeExpense(Records::newId(), amount,
                                              QDateTime::currentDateTimeUtc(),
                                              notes, categoryId);
    if (!store()->save(expense)) {
        emit logMessage(QString("Failed to save expense: %1").arg(store()->errorString()));
        return QString();
    }
    return expense.id;
}

} // namespace LedgerSync
