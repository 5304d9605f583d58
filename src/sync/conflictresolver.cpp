#include "conflictresolver.h"
#include "model/recordkinds.h"

#include <QSet>

namespace LedgerSync {

namespace {

bool isNumeric(const QVariant &value)
{
    switch (value.userType()) {
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Double:
    case QMetaType::Float:
        return true;
    default:
        return false;
    }
}

QStringList sortedUnion(const QStringList &a, const QStringList &b)
{
    QStringList result = a;
    for (const QString &item : b) {
        if (!result.contains(item)) {
            result.append(item);
        }
    }
    result.sort();
    return result;
}

} // namespace

ConflictResolver::ConflictResolver()
{
    setMergeMode(Records::Expense, MergeMode::Fieldwise);
    setMergeMode(Records::SharedBudget, MergeMode::Membership);
    setFieldRule(Records::SharedBudget, "startDate", FieldRule::Earliest);
    setFieldRule(Records::SharedBudget, "budgetAmount", FieldRule::Largest);
}

void ConflictResolver::setMergeMode(const QString &kind, MergeMode mode)
{
    m_modes.insert(kind, mode);
}

ConflictResolver::MergeMode ConflictResolver::mergeMode(const QString &kind) const
{
    return m_modes.value(kind, MergeMode::Scalar);
}

void ConflictResolver::setFieldRule(const QString &kind, const QString &field, FieldRule rule)
{
    m_fieldRules.insert(kind + "/" + field, rule);
}

ConflictResolver::FieldRule ConflictResolver::fieldRule(const QString &kind, const QString &field) const
{
    return m_fieldRules.value(kind + "/" + field, FieldRule::LastWriter);
}

SyncRecord ConflictResolver::resolve(const SyncRecord &local, const SyncRecord &remote) const
{
    switch (mergeMode(local.kind)) {
    case MergeMode::Fieldwise:
        return resolveFieldwise(local, remote);
    case MergeMode::Membership:
        return resolveMembershipSet(local, remote);
    case MergeMode::Scalar:
        break;
    }
    return resolveScalarRecord(local, remote);
}

bool ConflictResolver::remoteWins(const SyncRecord &local, const SyncRecord &remote)
{
    if (remote.modifiedMarker != local.modifiedMarker) {
        return remote.modifiedMarker > local.modifiedMarker;
    }
    if (local.sameContent(remote)) {
        return false;
    }
    return remote.canonicalPayload() > local.canonicalPayload();
}

int ConflictResolver::compareValues(const QVariant &a, const QVariant &b)
{
    if (isNumeric(a) && isNumeric(b)) {
        const double x = a.toDouble();
        const double y = b.toDouble();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    return QString::compare(a.toString(), b.toString());
}

SyncRecord ConflictResolver::resolveScalarRecord(const SyncRecord &local, const SyncRecord &remote) const
{
    SyncRecord result = remoteWins(local, remote) ? remote : local;
    result.id = local.id;
    return result;
}

SyncRecord ConflictResolver::resolveFieldwise(const SyncRecord &local, const SyncRecord &remote) const
{
    // A delete is a whole-record decision
    if (local.isDeleted || remote.isDeleted) {
        return resolveScalarRecord(local, remote);
    }

    const bool remoteIsWinner = remoteWins(local, remote);
    const SyncRecord &winner = remoteIsWinner ? remote : local;

    SyncRecord result = winner;
    result.id = local.id;
    result.modifiedMarker = qMax(local.modifiedMarker, remote.modifiedMarker);
    result.fields.clear();

    QSet<QString> names;
    for (auto it = local.fields.constBegin(); it != local.fields.constEnd(); ++it) {
        names.insert(it.key());
    }
    for (auto it = remote.fields.constBegin(); it != remote.fields.constEnd(); ++it) {
        names.insert(it.key());
    }

    for (const QString &name : std::as_const(names)) {
        const QVariant localValue = local.fields.value(name);
        const QVariant remoteValue = remote.fields.value(name);
        const bool localEmpty = SyncRecord::isEmptyValue(localValue);
        const bool remoteEmpty = SyncRecord::isEmptyValue(remoteValue);

        if (localEmpty && remoteEmpty) {
            continue;
        }
        if (localEmpty) {
            result.fields.insert(name, remoteValue);
            continue;
        }
        if (remoteEmpty) {
            result.fields.insert(name, localValue);
            continue;
        }

        switch (fieldRule(local.kind, name)) {
        case FieldRule::Earliest:
            result.fields.insert(name, compareValues(remoteValue, localValue) < 0 ? remoteValue : localValue);
            break;
        case FieldRule::Largest:
            result.fields.insert(name, compareValues(remoteValue, localValue) > 0 ? remoteValue : localValue);
            break;
        case FieldRule::LastWriter:
            result.fields.insert(name, remoteIsWinner ? remoteValue : localValue);
            break;
        }
    }
    return result;
}

SyncRecord ConflictResolver::resolveMembershipSet(const SyncRecord &local, const SyncRecord &remote) const
{
    SyncRecord result = resolveFieldwise(local, remote);
    if (result.isDeleted) {
        return result;
    }
    result.members = sortedUnion(local.members, remote.members);
    result.removedMembers = sortedUnion(local.removedMembers, remote.removedMembers);
    return result;
}

} // namespace LedgerSync
