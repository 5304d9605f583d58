#ifndef CONFLICTRESOLVER_H
#define CONFLICTRESOLVER_H

#include <QString>
#include <QHash>
#include <QVariant>

#include "syncrecord.h"

namespace LedgerSync {

/**
 * @brief Merges two versions of the same record
 *
 * Every function is deterministic and symmetric in content: resolving
 * (a, b) and (b, a) yields the same fields, so two devices that meet the
 * same pair of versions end up identical. The result always keeps the
 * local id. Nothing here touches a store.
 */
class ConflictResolver
{
public:
    /**
     * @brief How a record kind is merged
     */
    enum class MergeMode {
        Scalar,         ///< Whole record, last writer wins
        Fieldwise,      ///< Per field, non-empty beats empty
        Membership      ///< Fieldwise plus union of participants
    };

    /**
     * @brief Rule for a field both versions carry
     */
    enum class FieldRule {
        LastWriter,     ///< Value of the record-level winner
        Earliest,       ///< Smaller value
        Largest         ///< Larger value
    };

    ConflictResolver();

    void setMergeMode(const QString &kind, MergeMode mode);
    MergeMode mergeMode(const QString &kind) const;

    void setFieldRule(const QString &kind, const QString &field, FieldRule rule);
    FieldRule fieldRule(const QString &kind, const QString &field) const;

    /**
     * @brief Merge using the mode registered for local.kind
     */
    SyncRecord resolve(const SyncRecord &local, const SyncRecord &remote) const;

    /**
     * @brief Last writer wins on modifiedMarker
     *
     * Equal markers: identical content keeps local, otherwise the version
     * with the greater canonical payload wins.
     */
    SyncRecord resolveScalarRecord(const SyncRecord &local, const SyncRecord &remote) const;

    SyncRecord resolveFieldwise(const SyncRecord &local, const SyncRecord &remote) const;

    SyncRecord resolveMembershipSet(const SyncRecord &local, const SyncRecord &remote) const;

    /**
     * @brief Whether remote beats local under the last-writer rule
     */
    static bool remoteWins(const SyncRecord &local, const SyncRecord &remote);

    /**
     * @brief Numeric comparison when both values are numbers, else string
     */
    static int compareValues(const QVariant &a, const QVariant &b);

private:
    QHash<QString, MergeMode> m_modes;
    QHash<QString, FieldRule> m_fieldRules;     // "kind/field" -> rule
};

} // namespace LedgerSync

#endif // CONFLICTRESOLVER_H
