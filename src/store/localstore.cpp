#include "localstore.h"

#include <QDateTime>
#include <QReadLocker>
#include <QWriteLocker>
#include <QDebug>

namespace LedgerSync {

LocalStore::LocalStore(const StoreSchema &schema, QObject *parent)
    : QObject(parent)
    , m_schema(schema)
{
}

bool LocalStore::isReplicating() const
{
    QReadLocker locker(&m_lock);
    return m_replicating;
}

void LocalStore::setReplicating(bool replicating)
{
    QWriteLocker locker(&m_lock);
    m_replicating = replicating;
}

// ========== Record Operations ==========

QList<SyncRecord> LocalStore::fetch(const QString &kind, const Predicate &predicate) const
{
    QList<SyncRecord> result;
    QReadLocker locker(&m_lock);
    for (auto it = m_records.constBegin(); it != m_records.constEnd(); ++it) {
        const SyncRecord &record = it.value();
        if (record.kind != kind || record.isDeleted) {
            continue;
        }
        if (predicate && !predicate(record)) {
            continue;
        }
        result.append(record);
    }
    return result;
}

SyncRecord LocalStore::record(const QString &kind, const QString &id) const
{
    QReadLocker locker(&m_lock);
    return m_records.value(SyncRecord::keyFor(kind, id));
}

bool LocalStore::contains(const QString &kind, const QString &id) const
{
    QReadLocker locker(&m_lock);
    auto it = m_records.constFind(SyncRecord::keyFor(kind, id));
    return it != m_records.constEnd() && !it.value().isDeleted;
}

bool LocalStore::save(const SyncRecord &record)
{
    return write(record, true, nullptr) == WriteResult::Written;
}

bool LocalStore::remove(const QString &kind, const QString &id)
{
    SyncRecord tombstone = record(kind, id);
    if (!tombstone.isValid() || tombstone.isDeleted) {
        reportError(QString("No %1 with id %2 to delete").arg(kind, id));
        return false;
    }

    tombstone.isDeleted = true;
    tombstone.fields.clear();
    tombstone.members.clear();
    tombstone.removedMembers.clear();
    tombstone.modifiedMarker = 0;
    return save(tombstone);
}

bool LocalStore::applyRemote(const SyncRecord &record)
{
    return write(record, false, nullptr) == WriteResult::Written;
}

RecordSnapshot LocalStore::snapshot(const QString &kind, const QString &id) const
{
    const QString key = SyncRecord::keyFor(kind, id);
    RecordSnapshot result;

    QReadLocker locker(&m_lock);
    result.record = m_records.value(key);
    auto it = m_outbox.constFind(key);
    if (it != m_outbox.constEnd()) {
        result.pending = true;
        result.pendingMarker = it.value();
    }
    return result;
}

LocalStore::WriteResult LocalStore::applyRemoteIfUnchanged(const SyncRecord &record,
                                                           const RecordSnapshot &expected)
{
    return write(record, false, &expected);
}

LocalStore::WriteResult LocalStore::saveIfUnchanged(const SyncRecord &record,
                                                    const RecordSnapshot &expected)
{
    return write(record, true, &expected);
}

int LocalStore::recordCount(const QString &kind) const
{
    return fetch(kind).size();
}

bool LocalStore::checkWritable(const SyncRecord &record)
{
    if (!record.isValid()) {
        reportError("Record has no kind or id");
        return false;
    }
    if (!m_schema.contains(record.kind)) {
        reportError(QString("Record kind %1 is not part of the %2 schema")
                        .arg(record.kind, m_schema.name()));
        return false;
    }
    return true;
}

LocalStore::WriteResult LocalStore::write(const SyncRecord &record, bool local,
                                          const RecordSnapshot *expected)
{
    if (!checkWritable(record)) {
        return WriteResult::Failed;
    }

    bool ok;
    {
        QWriteLocker locker(&m_lock);
        if (expected && !matchesLocked(record.key(), *expected)) {
            qDebug() << "[LocalStore]" << record.description() << "changed since it was read";
            return WriteResult::Stale;
        }
        ok = writeLocked(record, local);
    }

    if (!ok) {
        reportError(QString(local ? "Failed to persist %1" : "Failed to persist remote %1")
                        .arg(record.description()));
        return WriteResult::Failed;
    }
    emit recordChanged(record.kind, record.id);
    return WriteResult::Written;
}

bool LocalStore::matchesLocked(const QString &key, const RecordSnapshot &expected) const
{
    auto it = m_records.constFind(key);
    const bool exists = it != m_records.constEnd();
    if (exists != expected.record.isValid()) {
        return false;
    }
    // Local saves always advance the marker
    if (exists && it.value().modifiedMarker != expected.record.modifiedMarker) {
        return false;
    }

    auto pending = m_outbox.constFind(key);
    if ((pending != m_outbox.constEnd()) != expected.pending) {
        return false;
    }
    return !expected.pending || pending.value() == expected.pendingMarker;
}

bool LocalStore::writeLocked(const SyncRecord &input, bool local)
{
    const QString key = input.key();
    const bool hadRecord = m_records.contains(key);
    const SyncRecord previous = m_records.value(key);
    const bool hadPending = m_outbox.contains(key);
    const qint64 previousPending = m_outbox.value(key);

    SyncRecord record = input;
    if (local) {
        record.modifiedMarker = stampMarker(record.modifiedMarker,
                                            hadRecord ? previous.modifiedMarker : 0);
        m_outbox.insert(key, record.modifiedMarker);
    } else {
        m_outbox.remove(key);
    }
    m_records.insert(key, record);

    if (persist()) {
        return true;
    }

    // Roll back so memory matches what is on disk
    if (hadRecord) {
        m_records.insert(key, previous);
    } else {
        m_records.remove(key);
    }
    if (hadPending) {
        m_outbox.insert(key, previousPending);
    } else {
        m_outbox.remove(key);
    }
    return false;
}

qint64 LocalStore::stampMarker(qint64 requested, qint64 stored)
{
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    if (requested <= 0) {
        return qMax(now, stored + 1);
    }
    if (requested <= stored) {
        return qMax(now, stored + 1);
    }
    return requested;
}

// ========== Outbox ==========

int LocalStore::pendingChangeCount() const
{
    QReadLocker locker(&m_lock);
    return m_outbox.size();
}

QList<SyncRecord> LocalStore::pendingChanges() const
{
    QList<SyncRecord> result;
    QReadLocker locker(&m_lock);
    for (auto it = m_outbox.constBegin(); it != m_outbox.constEnd(); ++it) {
        result.append(m_records.value(it.key()));
    }
    return result;
}

bool LocalStore::isPending(const QString &kind, const QString &id) const
{
    QReadLocker locker(&m_lock);
    return m_outbox.contains(SyncRecord::keyFor(kind, id));
}

bool LocalStore::markPushed(const SyncRecord &pushed)
{
    QWriteLocker locker(&m_lock);
    const QString key = pushed.key();
    auto it = m_outbox.find(key);
    if (it == m_outbox.end() || it.value() != pushed.modifiedMarker) {
        // Changed again since the push started; stays queued
        return false;
    }
    m_outbox.erase(it);

    if (!persist()) {
        m_outbox.insert(key, pushed.modifiedMarker);
        return false;
    }
    return true;
}

// ========== Pull Position ==========

qint64 LocalStore::pullToken() const
{
    QReadLocker locker(&m_lock);
    return m_pullToken;
}

bool LocalStore::setPullToken(qint64 token)
{
    QWriteLocker locker(&m_lock);
    if (token == m_pullToken) {
        return true;
    }
    const qint64 previous = m_pullToken;
    m_pullToken = token;
    if (!persist()) {
        m_pullToken = previous;
        return false;
    }
    return true;
}

// ========== Summary ==========

StoreSummary LocalStore::summary() const
{
    StoreSummary result;
    for (const QString &kind : m_schema.kinds()) {
        result.counts.insert(kind, 0);
    }

    QReadLocker locker(&m_lock);
    for (auto it = m_records.constBegin(); it != m_records.constEnd(); ++it) {
        if (it.value().isDeleted) {
            result.tombstones++;
        } else {
            result.counts[it.value().kind]++;
        }
    }
    result.pendingChanges = m_outbox.size();
    return result;
}

QString LocalStore::errorString() const
{
    QReadLocker locker(&m_lock);
    return m_errorString;
}

void LocalStore::reportError(const QString &error)
{
    {
        QWriteLocker locker(&m_lock);
        m_errorString = error;
    }
    qWarning() << "[LocalStore]" << storeId() << error;
    emit errorOccurred(error);
}

void LocalStore::resetState(const QMap<QString, SyncRecord> &records,
                            const QMap<QString, qint64> &outbox,
                            qint64 pullToken)
{
    QWriteLocker locker(&m_lock);
    m_records = records;
    m_outbox = outbox;
    m_pullToken = pullToken;
}

} // namespace LedgerSync
