#ifndef SYNCCOORDINATOR_H
#define SYNCCOORDINATOR_H

#include <QObject>
#include <QThread>

#include "synctypes.h"

namespace LedgerSync {

class LocalStore;
class RemoteCollaborator;
class ConflictResolver;
class Ticker;
class SyncWorker;

/**
 * @brief Runs replication rounds one at a time
 *
 * State machine:
 *   Idle -> Pushing -> Pulling -> Converging -> Settled | TimedOut | Failed
 *
 * Runs execute on a dedicated worker thread (SyncWorker). Only one run
 * is active; any triggers that arrive meanwhile collapse into a single
 * follow-up run started when the active one finishes.
 *
 * Lives on the main thread. Observers watch statusChanged().
 */
class SyncCoordinator : public QObject
{
    Q_OBJECT

public:
    SyncCoordinator(LocalStore *store,
                    RemoteCollaborator *remote,
                    const ConflictResolver *resolver,
                    Ticker *ticker,
                    QObject *parent = nullptr);
    ~SyncCoordinator() override;

    // ========== Configuration ==========

    void setConvergenceTimeout(int ms) { m_timeoutMs = ms; }
    void setPollInterval(int ms) { m_intervalMs = ms; }
    void setStableSamples(int samples) { m_stableSamples = samples; }

    int convergenceTimeout() const { return m_timeoutMs; }
    int pollInterval() const { return m_intervalMs; }
    int stableSamples() const { return m_stableSamples; }

    // ========== State ==========

    bool isRunning() const { return m_running; }
    bool hasFollowUpPending() const { return m_followUpPending; }
    SyncPhase phase() const { return m_phase; }
    SyncStatus status() const { return m_status; }
    SyncOutcome lastOutcome() const { return m_lastOutcome; }

    /**
     * @brief Runs started since construction
     */
    int runCount() const { return m_runCount; }

public slots:
    /**
     * @brief Start a run, or queue one follow-up if a run is active
     * @param trigger SyncTrigger value
     * @return false if replication is not active for this store
     */
    bool requestRun(int trigger);

    void triggerManualSync();

    /**
     * @brief Stop the active run's convergence polling early and drop any queued follow-up
     */
    void cancel();

signals:
    void statusChanged(const LedgerSync::SyncStatus &status);
    void phaseChanged(int phase);
    void runStarted(int trigger);
    void runFinished(const LedgerSync::SyncOutcome &outcome);
    void logMessage(const QString &message);

private slots:
    void onWorkerPhaseChanged(int phase);
    void onWorkerFinished(const LedgerSync::SyncOutcome &outcome);

private:
    void startRun(SyncTrigger trigger);
    void setStatus(const SyncStatus &status);
    void ensureWorkerThread();
    void stopWorkerThread();

    LocalStore *m_store;
    RemoteCollaborator *m_remote;
    const ConflictResolver *m_resolver;
    Ticker *m_ticker;

    QThread *m_workerThread = nullptr;
    SyncWorker *m_worker = nullptr;

    int m_timeoutMs = 30000;
    int m_intervalMs = 1000;
    int m_stableSamples = 3;

    bool m_running = false;
    bool m_followUpPending = false;
    int m_runCount = 0;
    SyncPhase m_phase = SyncPhase::Idle;
    SyncStatus m_status;
    SyncOutcome m_lastOutcome;
};

} // namespace LedgerSync

#endif // SYNCCOORDINATOR_H
