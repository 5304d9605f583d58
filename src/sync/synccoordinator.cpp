#include "synccoordinator.h"
#include "syncworker.h"
#include "store/localstore.h"
#include "remote/remotecollaborator.h"

#include <QDebug>
#include <QMetaObject>

namespace LedgerSync {

SyncCoordinator::SyncCoordinator(LocalStore *store,
                                 RemoteCollaborator *remote,
                                 const ConflictResolver *resolver,
                                 Ticker *ticker,
                                 QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_remote(remote)
    , m_resolver(resolver)
    , m_ticker(ticker)
{
    qRegisterMetaType<LedgerSync::SyncOutcome>("LedgerSync::SyncOutcome");
    qRegisterMetaType<LedgerSync::SyncStatus>("LedgerSync::SyncStatus");
    qDebug() << "[SyncCoordinator] Created";
}

SyncCoordinator::~SyncCoordinator()
{
    cancel();
    stopWorkerThread();
    qDebug() << "[SyncCoordinator] Destroyed";
}

// ========== Triggers ==========

bool SyncCoordinator::requestRun(int trigger)
{
    const SyncTrigger kind = static_cast<SyncTrigger>(trigger);

    if (!m_remote || !m_store || !m_store->isReplicating()) {
        qDebug() << "[SyncCoordinator] Ignoring" << syncTriggerName(kind)
                 << "trigger, replication is not active";
        return false;
    }

    if (m_running) {
        if (!m_followUpPending) {
            emit logMessage(QString("Sync in progress, %1 queued as follow-up")
                                .arg(syncTriggerName(kind)));
        }
        m_followUpPending = true;
        return true;
    }

    startRun(kind);
    return true;
}

void SyncCoordinator::triggerManualSync()
{
    requestRun(static_cast<int>(SyncTrigger::Manual));
}

void SyncCoordinator::cancel()
{
    m_followUpPending = false;
    if (!m_running || !m_worker) {
        return;
    }
    emit logMessage("Cancelling sync...");
    m_worker->requestCancel();
}

void SyncCoordinator::startRun(SyncTrigger trigger)
{
    ensureWorkerThread();

    m_running = true;
    m_runCount++;
    m_worker->resetCancel();
    m_phase = SyncPhase::Idle;

    emit runStarted(static_cast<int>(trigger));
    setStatus(SyncStatus::running());

    QMetaObject::invokeMethod(m_worker, "doRun",
                              Qt::QueuedConnection,
                              Q_ARG(int, static_cast<int>(trigger)),
                              Q_ARG(int, m_timeoutMs),
                              Q_ARG(int, m_intervalMs),
                              Q_ARG(int, m_stableSamples));
}

void SyncCoordinator::setStatus(const SyncStatus &status)
{
    m_status = status;
    emit statusChanged(status);
}

// ========== Worker Callbacks ==========

void SyncCoordinator::onWorkerPhaseChanged(int phase)
{
    m_phase = static_cast<SyncPhase>(phase);
    emit phaseChanged(phase);
}

void SyncCoordinator::onWorkerFinished(const SyncOutcome &outcome)
{
    m_running = false;
    m_lastOutcome = outcome;

    emit runFinished(outcome);

    if (outcome.finalPhase == SyncPhase::Failed) {
        setStatus(SyncStatus::failed(outcome));
    } else {
        setStatus(SyncStatus::settled(outcome));
    }

    if (m_followUpPending) {
        m_followUpPending = false;
        qDebug() << "[SyncCoordinator] Starting coalesced follow-up run";
        startRun(SyncTrigger::FollowUp);
    }
}

// ========== Worker Thread ==========

void SyncCoordinator::ensureWorkerThread()
{
    if (m_workerThread && m_workerThread->isRunning()) {
        return;
    }

    stopWorkerThread();

    m_workerThread = new QThread(this);
    m_worker = new SyncWorker(m_store, m_remote, m_resolver, m_ticker);
    m_worker->moveToThread(m_workerThread);

    connect(m_worker, &SyncWorker::phaseChanged,
            this, &SyncCoordinator::onWorkerPhaseChanged);
    connect(m_worker, &SyncWorker::runFinished,
            this, &SyncCoordinator::onWorkerFinished);
    connect(m_worker, &SyncWorker::logMessage,
            this, &SyncCoordinator::logMessage);

    // Clean up worker when thread finishes
    connect(m_workerThread, &QThread::finished,
            m_worker, &QObject::deleteLater);

    m_workerThread->start();
    qDebug() << "[SyncCoordinator] Worker thread started";
}

void SyncCoordinator::stopWorkerThread()
{
    if (m_workerThread) {
        m_workerThread->quit();
        if (!m_workerThread->wait(m_timeoutMs + 5000)) {
            qWarning() << "[SyncCoordinator] Worker thread didn't stop, terminating";
            m_workerThread->terminate();
            m_workerThread->wait();
        }
        delete m_workerThread;
        m_workerThread = nullptr;
        m_worker = nullptr;  // Deleted by thread finished signal
        qDebug() << "[SyncCoordinator] Worker thread stopped";
    }
}

} // namespace LedgerSync
