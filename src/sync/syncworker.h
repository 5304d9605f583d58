#ifndef SYNCWORKER_H
#define SYNCWORKER_H

#include <QObject>
#include <QList>
#include <atomic>

#include "synctypes.h"
#include "syncrecord.h"
#include "store/localstore.h"

namespace LedgerSync {

class RemoteCollaborator;
class ConflictResolver;
class Ticker;

/**
 * @brief Worker object that executes replication runs
 *
 * Lives on the coordinator's worker thread. A run is blocking: push the
 * outbox, pull remote changes, then poll the store until it quiesces.
 * Results go back to the main thread through queued signals.
 *
 * The store, remote, resolver and ticker are not owned.
 */
class SyncWorker : public QObject
{
    Q_OBJECT

public:
    SyncWorker(LocalStore *store,
               RemoteCollaborator *remote,
               const ConflictResolver *resolver,
               Ticker *ticker,
               QObject *parent = nullptr);
    ~SyncWorker() override;

    /**
     * @brief Stop convergence polling at the next tick
     *
     * Safe to call from any thread.
     */
    void requestCancel() { m_cancelRequested = true; }

    void resetCancel() { m_cancelRequested = false; }

public slots:
    /**
     * @brief Execute one run
     *
     * @param trigger SyncTrigger that started the run
     * @param timeoutMs Convergence timeout
     * @param intervalMs Convergence poll interval
     * @param stableSamples Equal samples needed to settle
     */
    void doRun(int trigger, int timeoutMs, int intervalMs, int stableSamples);

signals:
    void phaseChanged(int phase);

    void runFinished(const LedgerSync::SyncOutcome &outcome);

    void logMessage(const QString &message);

private:
    bool isCancelled() const { return m_cancelRequested.load(); }

    void setPhase(SyncPhase phase);
    void log(const QString &message);
    void fail(SyncOutcome &outcome, ErrorKind error, const QString &message);

    /**
     * @brief Flush the outbox
     * @return false if the run must stop (account error)
     */
    bool pushPending(SyncOutcome &outcome);
    bool canPushAgain(const SyncOutcome &outcome) const;

    /**
     * @brief Turn server versions of rejected records into new local versions
     * @return Records to push again
     */
    QList<SyncRecord> resolvePushConflicts(const QList<SyncRecord> &serverVersions,
                                           SyncOutcome &outcome);

    /**
     * @brief Apply remote changes since the stored pull token
     * @return false if the run must stop (account error)
     */
    bool pullChanges(SyncOutcome &outcome);

    /**
     * @brief Apply one pulled record against a fresh snapshot
     * @return false if a local write got in first and the record must be re-read
     */
    bool applyPulled(const SyncRecord &remote, SyncOutcome &outcome);

    bool mergePulled(const RecordSnapshot &current, const SyncRecord &remote, SyncOutcome &outcome);
    bool countPulled(LocalStore::WriteResult result, SyncOutcome &outcome);

    /**
     * @brief Save a merge so that it supersedes both versions
     */
    LocalStore::WriteResult saveMerged(SyncRecord merged, const RecordSnapshot &current,
                                       const SyncRecord &remote);

    void reportRemoteCounts();

    LocalStore *m_store;
    RemoteCollaborator *m_remote;
    const ConflictResolver *m_resolver;
    Ticker *m_ticker;

    std::atomic<bool> m_cancelRequested{false};
};

} // namespace LedgerSync

#endif // SYNCWORKER_H
