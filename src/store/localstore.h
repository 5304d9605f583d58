#ifndef LOCALSTORE_H
#define LOCALSTORE_H

#include <QObject>
#include <QString>
#include <QList>
#include <QMap>
#include <QReadWriteLock>
#include <functional>

#include "storeschema.h"
#include "sync/syncrecord.h"
#include "sync/synctypes.h"

namespace LedgerSync {

/**
 * @brief A record and its outbox state, read under one lock
 */
struct RecordSnapshot {
    SyncRecord record;          ///< Invalid if absent
    bool pending = false;
    qint64 pendingMarker = 0;
};

/**
 * @brief Local record store shared by the UI and the sync worker
 *
 * Holds records keyed by kind and id, plus an outbox of local changes
 * that have not been pushed yet. Subclasses decide where the data
 * lives by implementing persist().
 *
 * Two kinds of writes:
 *   - save()/remove(): local mutations, marker stamped, queued in the outbox
 *   - applyRemote(): pulled data, written as-is, clears the outbox entry
 *
 * All methods are thread-safe. The lock is held only while the in-memory
 * maps are updated and persist() runs, never across remote calls. Writers
 * that decide from an earlier read use the *IfUnchanged() variants so a
 * concurrent local save is never overwritten.
 */
class LocalStore : public QObject
{
    Q_OBJECT

public:
    using Predicate = std::function<bool(const SyncRecord &)>;

    enum class WriteResult {
        Written,
        Stale,      ///< Stored state no longer matches the snapshot
        Failed
    };

    explicit LocalStore(const StoreSchema &schema, QObject *parent = nullptr);
    ~LocalStore() override = default;

    // ========== Store Identity ==========

    /**
     * @brief Unique identifier for this store type ("json-file", "memory")
     */
    virtual QString storeId() const = 0;

    /**
     * @brief Whether data survives a process restart
     */
    virtual bool isPersistent() const = 0;

    StoreSchema schema() const { return m_schema; }

    /**
     * @brief Replication mode, fixed when the store is opened
     */
    bool isReplicating() const;

    // ========== Record Operations ==========

    /**
     * @brief Live (non-deleted) records of a kind, optionally filtered
     */
    QList<SyncRecord> fetch(const QString &kind, const Predicate &predicate = Predicate()) const;

    /**
     * @brief Any stored version including tombstones; invalid if absent
     */
    SyncRecord record(const QString &kind, const QString &id) const;

    bool contains(const QString &kind, const QString &id) const;

    /**
     * @brief Local create or update
     *
     * A zero marker is stamped with the current time; a marker that would
     * not advance past the stored version becomes max(now, stored + 1).
     */
    bool save(const SyncRecord &record);

    /**
     * @brief Local delete, kept as a tombstone until pushed
     */
    bool remove(const QString &kind, const QString &id);

    /**
     * @brief Write a version received from the remote
     */
    bool applyRemote(const SyncRecord &record);

    RecordSnapshot snapshot(const QString &kind, const QString &id) const;

    /**
     * @brief applyRemote() if the record and its outbox entry still match @p expected
     */
    WriteResult applyRemoteIfUnchanged(const SyncRecord &record, const RecordSnapshot &expected);

    /**
     * @brief save() if the record and its outbox entry still match @p expected
     */
    WriteResult saveIfUnchanged(const SyncRecord &record, const RecordSnapshot &expected);

    int recordCount(const QString &kind) const;

    // ========== Outbox ==========

    int pendingChangeCount() const;
    QList<SyncRecord> pendingChanges() const;
    bool isPending(const QString &kind, const QString &id) const;

    /**
     * @brief Drop the outbox entry if the pushed version is still current
     * @return true if the entry was cleared
     */
    bool markPushed(const SyncRecord &pushed);

    // ========== Pull Position ==========

    qint64 pullToken() const;
    bool setPullToken(qint64 token);

    // ========== Summary ==========

    StoreSummary summary() const;

    QString errorString() const;

signals:
    void recordChanged(const QString &kind, const QString &id);
    void errorOccurred(const QString &error);

protected:
    /**
     * @brief Write the current state; called with the write lock held
     */
    virtual bool persist() = 0;

    void setReplicating(bool replicating);
    void reportError(const QString &error);

    /**
     * @brief Replace the whole state, used when loading from disk
     */
    void resetState(const QMap<QString, SyncRecord> &records,
                    const QMap<QString, qint64> &outbox,
                    qint64 pullToken);

    mutable QReadWriteLock m_lock;
    QMap<QString, SyncRecord> m_records;    // key -> record (tombstones included)
    QMap<QString, qint64> m_outbox;         // key -> marker of the pending version
    qint64 m_pullToken = 0;

private:
    bool checkWritable(const SyncRecord &record);
    WriteResult write(const SyncRecord &record, bool local, const RecordSnapshot *expected);
    bool matchesLocked(const QString &key, const RecordSnapshot &expected) const;
    bool writeLocked(const SyncRecord &record, bool local);
    static qint64 stampMarker(qint64 requested, qint64 stored);

    StoreSchema m_schema;
    bool m_replicating = false;
    QString m_errorString;
};

} // namespace LedgerSync

#endif // LOCALSTORE_H
