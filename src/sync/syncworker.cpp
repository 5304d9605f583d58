#include "syncworker.h"
#include "conflictresolver.h"
#include "convergencedetector.h"
#include "store/localstore.h"
#include "remote/remotecollaborator.h"
#include "model/recordkinds.h"

#include <QDebug>
#include <QThread>

namespace LedgerSync {

namespace {
// A record edited locally this many times during one pull is left to the push path
const int kMaxPullAttempts = 3;
}

SyncWorker::SyncWorker(LocalStore *store,
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
    qDebug() << "[SyncWorker] Created on thread:" << QThread::currentThread();
}

SyncWorker::~SyncWorker()
{
    qDebug() << "[SyncWorker] Destroyed";
}

void SyncWorker::setPhase(SyncPhase phase)
{
    emit phaseChanged(static_cast<int>(phase));
}

void SyncWorker::log(const QString &message)
{
    qDebug() << "[SyncWorker]" << message;
    emit logMessage(message);
}

void SyncWorker::fail(SyncOutcome &outcome, ErrorKind error, const QString &message)
{
    outcome.error = error;
    outcome.errorMessage = message;
    outcome.finalPhase = SyncPhase::Failed;
    qWarning() << "[SyncWorker] Run failed:" << errorKindName(error) << message;
    emit logMessage(QString("Sync failed: %1").arg(message));
}

// ========== Run ==========

void SyncWorker::doRun(int trigger, int timeoutMs, int intervalMs, int stableSamples)
{
    SyncOutcome outcome;
    outcome.trigger = static_cast<SyncTrigger>(trigger);
    outcome.startTime = QDateTime::currentDateTime();

    log(QString("Sync started (%1)").arg(syncTriggerName(outcome.trigger)));

    // Account gate: nothing is touched until the account is usable
    AccountStatus account = m_remote->accountStatus();
    if (account == AccountStatus::NoAccount || account == AccountStatus::Restricted) {
        fail(outcome, ErrorKind::Account, accountStatusDescription(account));
        outcome.endTime = QDateTime::currentDateTime();
        setPhase(SyncPhase::Failed);
        emit runFinished(outcome);
        return;
    }
    if (account == AccountStatus::Unknown) {
        log(QString("Account status: %1, continuing").arg(accountStatusDescription(account)));
    }

    setPhase(SyncPhase::Pushing);
    if (!pushPending(outcome)) {
        outcome.endTime = QDateTime::currentDateTime();
        setPhase(SyncPhase::Failed);
        emit runFinished(outcome);
        return;
    }

    setPhase(SyncPhase::Pulling);
    if (!pullChanges(outcome)) {
        outcome.endTime = QDateTime::currentDateTime();
        setPhase(SyncPhase::Failed);
        emit runFinished(outcome);
        return;
    }

    // Merges made during the pull go out in the same run
    if (m_store->pendingChangeCount() > 0 && canPushAgain(outcome) && !pushPending(outcome)) {
        outcome.endTime = QDateTime::currentDateTime();
        setPhase(SyncPhase::Failed);
        emit runFinished(outcome);
        return;
    }

    setPhase(SyncPhase::Converging);
    ConvergenceDetector detector(m_ticker, [this]() { return m_store->summary(); });
    detector.setInterval(intervalMs);
    detector.setRequiredStableSamples(stableSamples);
    detector.setCancelCheck([this]() { return isCancelled(); });
    detector.setOnChange([this, &outcome]() {
        if (m_store->pendingChangeCount() > 0 && canPushAgain(outcome)) {
            log("Local changes during sync, pushing again");
            pushPending(outcome);
        }
    });

    outcome.converged = detector.awaitConvergence(timeoutMs);
    outcome.finalPhase = outcome.converged ? SyncPhase::Settled : SyncPhase::TimedOut;
    if (!outcome.converged) {
        log(QString("No convergence within %1 ms, data may still be syncing").arg(timeoutMs));
    }

    outcome.localCounts = m_store->summary().counts;
    reportRemoteCounts();

    outcome.endTime = QDateTime::currentDateTime();
    setPhase(outcome.finalPhase);
    log(QString("Sync finished: %1").arg(outcome.summary()));
    emit runFinished(outcome);
}

// ========== Push ==========

bool SyncWorker::canPushAgain(const SyncOutcome &outcome) const
{
    // Transient failures wait for the next trigger
    return outcome.error == ErrorKind::None || outcome.error == ErrorKind::ConflictableWrite;
}

bool SyncWorker::pushPending(SyncOutcome &outcome)
{
    QList<SyncRecord> pending = m_store->pendingChanges();
    if (pending.isEmpty()) {
        return true;
    }

    log(QString("Pushing %1 local change(s)").arg(pending.size()));

    bool retried = false;
    while (!pending.isEmpty()) {
        RemoteResult<PushReport> result = m_remote->push(pending);

        for (const SyncRecord &accepted : std::as_const(result.value.accepted)) {
            if (m_store->markPushed(accepted)) {
                outcome.pushed++;
            }
        }

        if (result.ok()) {
            if (outcome.error == ErrorKind::ConflictableWrite) {
                // An earlier collision in this run has now gone through
                outcome.error = ErrorKind::None;
                outcome.errorMessage.clear();
            }
            return true;
        }

        switch (result.error) {
        case ErrorKind::Account:
            fail(outcome, ErrorKind::Account, result.message);
            return false;

        case ErrorKind::ConflictableWrite:
            if (retried) {
                log(QString("Push still conflicting after retry, will retry next sync: %1")
                        .arg(result.message));
                outcome.error = ErrorKind::ConflictableWrite;
                outcome.errorMessage = result.message;
                return true;
            }
            log(QString("Push conflict: %1").arg(result.message));
            pending = resolvePushConflicts(result.value.conflicts, outcome);
            retried = true;
            break;

        default:
            log(QString("Push failed (%1), will retry next sync: %2")
                    .arg(errorKindName(result.error), result.message));
            outcome.error = result.error;
            outcome.errorMessage = result.message;
            return true;
        }
    }
    return true;
}

QList<SyncRecord> SyncWorker::resolvePushConflicts(const QList<SyncRecord> &serverVersions,
                                                   SyncOutcome &outcome)
{
    QList<SyncRecord> retry;
    for (const SyncRecord &server : serverVersions) {
        const RecordSnapshot current = m_store->snapshot(server.kind, server.id);
        if (!current.record.isValid()) {
            continue;
        }
        outcome.conflicts++;

        SyncRecord resolved = m_resolver->resolve(current.record, server);
        LocalStore::WriteResult result;
        if (resolved.sameContent(server)) {
            // Server already holds the answer
            result = m_store->applyRemoteIfUnchanged(server, current);
        } else {
            result = saveMerged(resolved, current, server);
            if (result == LocalStore::WriteResult::Written) {
                retry.append(m_store->record(server.kind, server.id));
            }
        }

        if (result == LocalStore::WriteResult::Stale) {
            log(QString("%1 edited during conflict resolution, stays queued")
                    .arg(server.description()));
        }
    }
    return retry;
}

LocalStore::WriteResult SyncWorker::saveMerged(SyncRecord merged, const RecordSnapshot &current,
                                               const SyncRecord &remote)
{
    // The remote only accepts markers past its own
    merged.modifiedMarker = qMax(current.record.modifiedMarker, remote.modifiedMarker) + 1;
    LocalStore::WriteResult result = m_store->saveIfUnchanged(merged, current);
    if (result == LocalStore::WriteResult::Failed) {
        qWarning() << "[SyncWorker] Failed to save merged" << merged.description()
                   << m_store->errorString();
    }
    return result;
}

// ========== Pull ==========

bool SyncWorker::pullChanges(SyncOutcome &outcome)
{
    const qint64 token = m_store->pullToken();
    RemoteResult<PullBatch> result = m_remote->pull(token);

    if (!result.ok()) {
        if (result.error == ErrorKind::Account) {
            fail(outcome, ErrorKind::Account, result.message);
            return false;
        }
        log(QString("Pull failed (%1), will retry next sync: %2")
                .arg(errorKindName(result.error), result.message));
        outcome.error = result.error;
        outcome.errorMessage = result.message;
        return true;
    }

    const StoreSchema schema = m_store->schema();
    for (const SyncRecord &remote : std::as_const(result.value.records)) {
        if (isCancelled()) {
            log("Pull cancelled, resuming next sync");
            return true;
        }
        if (!schema.contains(remote.kind)) {
            qDebug() << "[SyncWorker] Skipping" << remote.description()
                     << "- kind not in the" << schema.name() << "schema";
            continue;
        }

        bool applied = false;
        for (int attempt = 0; attempt < kMaxPullAttempts && !applied; ++attempt) {
            applied = applyPulled(remote, outcome);
        }
        if (!applied) {
            // The local edit stays queued and meets this version on push
            log(QString("%1 keeps changing locally, merging on next push")
                    .arg(remote.description()));
        }
    }

    if (!m_store->setPullToken(result.value.serverToken)) {
        qWarning() << "[SyncWorker] Failed to store pull token" << result.value.serverToken;
    }

    log(QString("Pulled %1 record(s)").arg(outcome.pulled));
    return true;
}

bool SyncWorker::applyPulled(const SyncRecord &remote, SyncOutcome &outcome)
{
    const RecordSnapshot current = m_store->snapshot(remote.kind, remote.id);
    const SyncRecord &local = current.record;

    if (!local.isValid()) {
        return countPulled(m_store->applyRemoteIfUnchanged(remote, current), outcome);
    }

    if (local.modifiedMarker == remote.modifiedMarker && local.sameContent(remote)) {
        // Our own write coming back
        if (current.pending) {
            m_store->markPushed(local);
        }
        return true;
    }

    if (current.pending) {
        return mergePulled(current, remote, outcome);
    }
    if (remote.modifiedMarker >= local.modifiedMarker) {
        return countPulled(m_store->applyRemoteIfUnchanged(remote, current), outcome);
    }

    qDebug() << "[SyncWorker] Ignoring older remote" << remote.description();
    return true;
}

bool SyncWorker::countPulled(LocalStore::WriteResult result, SyncOutcome &outcome)
{
    if (result == LocalStore::WriteResult::Written) {
        outcome.pulled++;
    }
    return result != LocalStore::WriteResult::Stale;
}

bool SyncWorker::mergePulled(const RecordSnapshot &current, const SyncRecord &remote,
                             SyncOutcome &outcome)
{
    const SyncRecord &local = current.record;
    SyncRecord resolved = m_resolver->resolve(local, remote);

    LocalStore::WriteResult result = LocalStore::WriteResult::Written;
    if (resolved.sameContent(remote)) {
        if (!countPulled(m_store->applyRemoteIfUnchanged(remote, current), outcome)) {
            return false;
        }
    } else if (resolved.sameContent(local) && local.modifiedMarker > remote.modifiedMarker) {
        // Local stays pending and will win on push
    } else {
        result = saveMerged(resolved, current, remote);
    }

    if (result == LocalStore::WriteResult::Stale) {
        return false;
    }
    outcome.conflicts++;
    return true;
}

void SyncWorker::reportRemoteCounts()
{
    RemoteResult<QMap<QString, int>> counts = m_remote->recordCounts();
    if (!counts.ok()) {
        qDebug() << "[SyncWorker] Could not read remote counts:" << counts.message;
        return;
    }
    log(QString("Remote holds %1 expense(s), %2 categor(ies)")
            .arg(counts.value.value(Records::Expense))
            .arg(counts.value.value(Records::Category)));
}

} // namespace LedgerSync
