#include "syncrecord.h"

#include <QJsonArray>
#include <QJsonDocument>

namespace LedgerSync {

SyncRecord::SyncRecord(const QString &kind, const QString &id)
    : id(id)
    , kind(kind)
{
}

QString SyncRecord::keyFor(const QString &kind, const QString &id)
{
    return kind + "/" + id;
}

void SyncRecord::setField(const QString &name, const QVariant &value)
{
    if (value.isNull()) {
        fields.remove(name);
    } else {
        fields[name] = value;
    }
}

bool SyncRecord::isEmptyValue(const QVariant &value)
{
    if (!value.isValid() || value.isNull()) {
        return true;
    }
    if (value.userType() == QMetaType::QString) {
        return value.toString().isEmpty();
    }
    return false;
}

// ========== Membership ==========

bool SyncRecord::addMember(const QString &memberId)
{
    if (memberId.isEmpty() || removedMembers.contains(memberId)) {
        return false;
    }

    if (!members.contains(memberId)) {
        members.append(memberId);
        members.sort();
    }
    return true;
}

void SyncRecord::removeMember(const QString &memberId)
{
    if (memberId.isEmpty() || !members.contains(memberId)) return;

    if (!removedMembers.contains(memberId)) {
        removedMembers.append(memberId);
        removedMembers.sort();
    }
}

bool SyncRecord::isMember(const QString &memberId) const
{
    return members.contains(memberId) && !removedMembers.contains(memberId);
}

QStringList SyncRecord::activeMembers() const
{
    QStringList active;
    for (const QString &m : members) {
        if (!removedMembers.contains(m)) {
            active.append(m);
        }
    }
    return active;
}

// ========== Comparison ==========

QByteArray SyncRecord::canonicalPayload() const
{
    QJsonObject obj;
    obj["kind"] = kind;
    obj["fields"] = QJsonObject::fromVariantMap(fields);
    obj["members"] = QJsonArray::fromStringList(members);
    obj["removedMembers"] = QJsonArray::fromStringList(removedMembers);
    obj["deleted"] = isDeleted;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

bool SyncRecord::sameContent(const SyncRecord &other) const
{
    return canonicalPayload() == other.canonicalPayload();
}

bool SyncRecord::operator==(const SyncRecord &other) const
{
    return id == other.id
        && modifiedMarker == other.modifiedMarker
        && sameContent(other);
}

// ========== Serialization ==========

QJsonObject SyncRecord::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["kind"] = kind;
    obj["modifiedMarker"] = modifiedMarker;
    obj["fields"] = QJsonObject::fromVariantMap(fields);
    if (!members.isEmpty()) {
        obj["members"] = QJsonArray::fromStringList(members);
    }
    if (!removedMembers.isEmpty()) {
        obj["removedMembers"] = QJsonArray::fromStringList(removedMembers);
    }
    if (isDeleted) {
        obj["deleted"] = true;
    }
    return obj;
}

SyncRecord SyncRecord::fromJson(const QJsonObject &json)
{
    SyncRecord record;
    record.id = json["id"].toString();
    record.kind = json["kind"].toString();
    record.modifiedMarker = static_cast<qint64>(json["modifiedMarker"].toDouble());
    record.fields = json["fields"].toObject().toVariantMap();

    for (const QJsonValue &val : json["members"].toArray()) {
        record.members << val.toString();
    }
    for (const QJsonValue &val : json["removedMembers"].toArray()) {
        record.removedMembers << val.toString();
    }
    record.members.sort();
    record.removedMembers.sort();

    record.isDeleted = json["deleted"].toBool();
    return record;
}

QString SyncRecord::description() const
{
    QString name = fields.value("name").toString();
    if (name.isEmpty()) {
        name = fields.value("notes").toString();
    }
    if (name.isEmpty()) {
        return key();
    }
    return QString("%1 (%2)").arg(name, key());
}

} // namespace LedgerSync
