#ifndef SYNCRECORD_H
#define SYNCRECORD_H

#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QByteArray>
#include <QJsonObject>

namespace LedgerSync {

/**
 * @brief A locally persisted entity that participates in replication
 *
 * The id is the join key for conflict resolution and never changes after
 * creation. modifiedMarker is a millisecond timestamp used as the proxy
 * for "more recent"; the store keeps it non-decreasing per record.
 *
 * Membership records (shared budgets) also carry members and
 * removedMembers. Both merge by union; the active membership is the
 * difference of the two. A removal is final: a removed participant
 * cannot be added back to the same record.
 */
class SyncRecord
{
public:
    SyncRecord() = default;
    SyncRecord(const QString &kind, const QString &id);

    QString id;                 ///< Stable identity
    QString kind;               ///< Record kind: "Expense", "Category", ...
    qint64 modifiedMarker = 0;  ///< Milliseconds since epoch, 0 = unset
    QVariantMap fields;         ///< Payload
    QStringList members;        ///< Participants ever added
    QStringList removedMembers; ///< Participants explicitly removed
    bool isDeleted = false;     ///< Tombstone

    bool isValid() const { return !id.isEmpty() && !kind.isEmpty(); }

    /**
     * @brief Storage key, unique across kinds
     */
    QString key() const { return keyFor(kind, id); }
    static QString keyFor(const QString &kind, const QString &id);

    // ========== Payload ==========

    QVariant field(const QString &name) const { return fields.value(name); }
    void setField(const QString &name, const QVariant &value);

    /**
     * @brief Whether a field value counts as empty for fieldwise merges
     *
     * Null/invalid variants and empty strings are empty; zero is not.
     */
    static bool isEmptyValue(const QVariant &value);

    // ========== Membership ==========

    /**
     * @return false if the id is empty or was removed earlier
     */
    bool addMember(const QString &memberId);
    void removeMember(const QString &memberId);
    bool isMember(const QString &memberId) const;
    QStringList activeMembers() const;

    // ========== Comparison ==========

    /**
     * @brief Compact JSON of everything except id and marker
     *
     * Keys are sorted, so equal content always yields equal bytes.
     */
    QByteArray canonicalPayload() const;

    /**
     * @brief Same kind, fields, membership and deletion state
     */
    bool sameContent(const SyncRecord &other) const;

    bool operator==(const SyncRecord &other) const;
    bool operator!=(const SyncRecord &other) const { return !(*this == other); }

    // ========== Serialization ==========

    QJsonObject toJson() const;
    static SyncRecord fromJson(const QJsonObject &json);

    QString description() const;
};

} // namespace LedgerSync

#endif // SYNCRECORD_H
