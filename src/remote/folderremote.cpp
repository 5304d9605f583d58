#include "folderremote.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QLockFile>
#include <QFileSystemWatcher>
#include <QJsonDocument>
#include <QJsonArray>
#include <QDateTime>
#include <QSet>
#include <QDebug>

namespace LedgerSync {

namespace {

struct ServerRecord {
    SyncRecord record;
    qint64 serverSeq = 0;
    QString lastWriter;
};

struct ServerState {
    qint64 seq = 0;
    QMap<QString, ServerRecord> records;    // record key -> entry
};

ServerState parseServerState(const QJsonObject &root)
{
    ServerState state;
    state.seq = static_cast<qint64>(root["seq"].toDouble());

    const QJsonArray array = root["records"].toArray();
    for (const QJsonValue &value : array) {
        QJsonObject obj = value.toObject();
        ServerRecord entry;
        entry.record = SyncRecord::fromJson(obj);
        entry.serverSeq = static_cast<qint64>(obj["serverSeq"].toDouble());
        entry.lastWriter = obj["lastWriter"].toString();
        if (entry.record.isValid()) {
            state.records.insert(entry.record.key(), entry);
        }
    }
    return state;
}

QJsonObject serializeServerState(const ServerState &state)
{
    QJsonArray array;
    for (const ServerRecord &entry : state.records) {
        QJsonObject obj = entry.record.toJson();
        obj["serverSeq"] = static_cast<double>(entry.serverSeq);
        obj["lastWriter"] = entry.lastWriter;
        array.append(obj);
    }

    QJsonObject root;
    root["seq"] = static_cast<double>(state.seq);
    root["records"] = array;
    return root;
}

} // namespace

FolderRemote::FolderRemote(const QString &rootPath,
                           const QString &deviceId,
                           QObject *parent)
    : RemoteCollaborator(parent)
    , m_rootPath(rootPath)
    , m_deviceId(deviceId)
{
    m_watcher = new QFileSystemWatcher(this);
    connect(m_watcher, &QFileSystemWatcher::fileChanged,
            this, &FolderRemote::checkForChanges);
    connect(m_watcher, &QFileSystemWatcher::directoryChanged,
            this, &FolderRemote::checkForChanges);
}

FolderRemote::~FolderRemote() = default;

QString FolderRemote::accountFilePath() const
{
    return QDir(m_rootPath).filePath("account.json");
}

QString FolderRemote::recordsFilePath() const
{
    return QDir(m_rootPath).filePath("records.json");
}

QString FolderRemote::subscriptionsFilePath() const
{
    return QDir(m_rootPath).filePath("subscriptions.json");
}

QString FolderRemote::lockFilePath() const
{
    return QDir(m_rootPath).filePath(".lock");
}

QString FolderRemote::subscriptionIdFor(const QString &recordKind)
{
    return recordKind.toLower() + "-updates";
}

// ========== File Helpers ==========

bool FolderRemote::readJson(const QString &path, QJsonObject *object, QString *error) const
{
    QFile file(path);
    if (!file.exists()) {
        *object = QJsonObject();
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        *error = QString("Cannot read %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        *error = QString("Corrupt %1: %2").arg(path, parseError.errorString());
        return false;
    }
    *object = doc.object();
    return true;
}

bool FolderRemote::writeJson(const QString &path, const QJsonObject &object, QString *error) const
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        *error = QString("Cannot write %1: %2").arg(path, file.errorString());
        return false;
    }
    file.write(QJsonDocument(object).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        *error = QString("Cannot commit %1").arg(path);
        return false;
    }
    return true;
}

// ========== Account ==========

bool FolderRemote::initializeAccount(const QString &rootPath, QString *errorMessage)
{
    QDir dir(rootPath);
    if (!dir.mkpath(".")) {
        if (errorMessage) {
            *errorMessage = QString("Cannot create %1").arg(rootPath);
        }
        return false;
    }

    const QString accountPath = dir.filePath("account.json");
    if (QFileInfo::exists(accountPath)) {
        return true;
    }

    QJsonObject account;
    account["status"] = "available";
    account["created"] = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);

    QSaveFile file(accountPath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage) {
            *errorMessage = QString("Cannot write %1").arg(accountPath);
        }
        return false;
    }
    file.write(QJsonDocument(account).toJson());
    if (!file.commit()) {
        if (errorMessage) {
            *errorMessage = QString("Cannot commit %1").arg(accountPath);
        }
        return false;
    }

    qDebug() << "[FolderRemote] Initialized account in" << rootPath;
    return true;
}

AccountStatus FolderRemote::accountStatus()
{
    if (m_rootPath.isEmpty() || !QFileInfo(m_rootPath).isDir()) {
        return AccountStatus::NoAccount;
    }
    if (!QFileInfo::exists(accountFilePath())) {
        return AccountStatus::NoAccount;
    }

    QJsonObject account;
    QString error;
    if (!readJson(accountFilePath(), &account, &error)) {
        qWarning() << "[FolderRemote]" << error;
        return AccountStatus::Unknown;
    }

    const QString status = account["status"].toString();
    if (status == "available") {
        return AccountStatus::Available;
    }
    if (status == "restricted") {
        return AccountStatus::Restricted;
    }
    return AccountStatus::Unknown;
}

// ========== Records ==========

RemoteResult<PushReport> FolderRemote::push(const QList<SyncRecord> &records)
{
    if (records.isEmpty()) {
        return RemoteResult<PushReport>::success(PushReport());
    }

    QLockFile lock(lockFilePath());
    if (!lock.tryLock(m_lockTimeoutMs)) {
        return RemoteResult<PushReport>::failure(ErrorKind::TransientNetwork,
                                                 "Remote is busy (lock timeout)");
    }

    QJsonObject root;
    QString error;
    if (!readJson(recordsFilePath(), &root, &error)) {
        return RemoteResult<PushReport>::failure(ErrorKind::TransientNetwork, error);
    }
    ServerState state = parseServerState(root);

    PushReport report;
    bool modified = false;
    for (const SyncRecord &record : records) {
        auto it = state.records.find(record.key());
        if (it != state.records.end()) {
            const SyncRecord &server = it.value().record;
            if (server.modifiedMarker == record.modifiedMarker && server.sameContent(record)) {
                report.accepted.append(record);
                continue;
            }
            // Stale write, or same marker with other content
            if (server.modifiedMarker >= record.modifiedMarker) {
                report.conflicts.append(server);
                continue;
            }
        }

        ServerRecord entry;
        entry.record = record;
        entry.serverSeq = ++state.seq;
        entry.lastWriter = m_deviceId;
        state.records.insert(record.key(), entry);
        report.accepted.append(record);
        modified = true;
    }

    if (modified && !writeJson(recordsFilePath(), serializeServerState(state), &error)) {
        return RemoteResult<PushReport>::failure(ErrorKind::TransientNetwork, error);
    }

    qDebug() << "[FolderRemote]" << m_deviceId << "pushed" << report.accepted.size()
             << "records," << report.conflicts.size() << "conflicts";

    if (!report.conflicts.isEmpty()) {
        RemoteResult<PushReport> result = RemoteResult<PushReport>::failure(
            ErrorKind::ConflictableWrite,
            QString("%1 record(s) changed on the server").arg(report.conflicts.size()));
        result.value = report;
        return result;
    }
    return RemoteResult<PushReport>::success(report);
}

RemoteResult<PullBatch> FolderRemote::pull(qint64 sinceToken)
{
    QLockFile lock(lockFilePath());
    if (!lock.tryLock(m_lockTimeoutMs)) {
        return RemoteResult<PullBatch>::failure(ErrorKind::TransientNetwork,
                                                "Remote is busy (lock timeout)");
    }

    QJsonObject root;
    QString error;
    if (!readJson(recordsFilePath(), &root, &error)) {
        return RemoteResult<PullBatch>::failure(ErrorKind::TransientNetwork, error);
    }
    ServerState state = parseServerState(root);

    PullBatch batch;
    batch.serverToken = state.seq;
    for (const ServerRecord &entry : std::as_const(state.records)) {
        if (entry.serverSeq > sinceToken) {
            batch.records.append(entry.record);
        }
    }
    return RemoteResult<PullBatch>::success(batch);
}

RemoteResult<QMap<QString, int>> FolderRemote::recordCounts()
{
    RemoteResult<PullBatch> all = pull(0);
    if (!all.ok()) {
        return RemoteResult<QMap<QString, int>>::failure(all.error, all.message);
    }

    QMap<QString, int> counts;
    for (const SyncRecord &record : std::as_const(all.value.records)) {
        if (!record.isDeleted) {
            counts[record.kind]++;
        }
    }
    return RemoteResult<QMap<QString, int>>::success(counts);
}

// ========== Subscriptions ==========

RemoteResult<SubscriptionDescriptor> FolderRemote::subscribe(const QString &recordKind)
{
    using Result = RemoteResult<SubscriptionDescriptor>;

    if (recordKind.isEmpty()) {
        return Result::failure(ErrorKind::Configuration, "No record kind given");
    }

    QLockFile lock(lockFilePath());
    if (!lock.tryLock(m_lockTimeoutMs)) {
        return Result::failure(ErrorKind::TransientNetwork, "Remote is busy (lock timeout)");
    }

    QJsonObject root;
    QString error;
    if (!readJson(subscriptionsFilePath(), &root, &error)) {
        return Result::failure(ErrorKind::TransientNetwork, error);
    }

    SubscriptionDescriptor descriptor;
    descriptor.id = subscriptionIdFor(recordKind);
    descriptor.recordKind = recordKind;

    {
        QMutexLocker locker(&m_mutex);
        m_subscriptions.insert(descriptor.id, recordKind);
    }
    startWatching();

    QJsonObject device = root[m_deviceId].toObject();
    if (device.contains(descriptor.id)) {
        Result result = Result::failure(ErrorKind::AlreadySubscribed,
                                        QString("Subscription %1 already exists").arg(descriptor.id));
        result.value = descriptor;
        return result;
    }

    device[descriptor.id] = recordKind;
    root[m_deviceId] = device;
    if (!writeJson(subscriptionsFilePath(), root, &error)) {
        return Result::failure(ErrorKind::TransientNetwork, error);
    }

    qDebug() << "[FolderRemote]" << m_deviceId << "subscribed to" << recordKind;
    return Result::success(descriptor);
}

RemoteResult<bool> FolderRemote::unsubscribe(const QString &subscriptionId)
{
    {
        QMutexLocker locker(&m_mutex);
        m_subscriptions.remove(subscriptionId);
    }

    QLockFile lock(lockFilePath());
    if (!lock.tryLock(m_lockTimeoutMs)) {
        return RemoteResult<bool>::failure(ErrorKind::TransientNetwork,
                                           "Remote is busy (lock timeout)");
    }

    QJsonObject root;
    QString error;
    if (!readJson(subscriptionsFilePath(), &root, &error)) {
        return RemoteResult<bool>::failure(ErrorKind::TransientNetwork, error);
    }

    QJsonObject device = root[m_deviceId].toObject();
    const bool existed = device.contains(subscriptionId);
    device.remove(subscriptionId);
    root[m_deviceId] = device;

    if (existed && !writeJson(subscriptionsFilePath(), root, &error)) {
        return RemoteResult<bool>::failure(ErrorKind::TransientNetwork, error);
    }
    return RemoteResult<bool>::success(existed);
}

// ========== Change Detection ==========

void FolderRemote::startWatching()
{
    if (!m_watcher->directories().contains(m_rootPath) && QFileInfo(m_rootPath).isDir()) {
        m_watcher->addPath(m_rootPath);
    }
    if (QFileInfo::exists(recordsFilePath()) && !m_watcher->files().contains(recordsFilePath())) {
        m_watcher->addPath(recordsFilePath());
    }

    QMutexLocker locker(&m_mutex);
    if (m_lastSeenSeq < 0) {
        QJsonObject root;
        QString error;
        m_lastSeenSeq = readJson(recordsFilePath(), &root, &error)
                            ? static_cast<qint64>(root["seq"].toDouble())
                            : 0;
    }
}

void FolderRemote::checkForChanges()
{
    // The atomic replace drops the file from the watch list
    if (QFileInfo::exists(recordsFilePath()) && !m_watcher->files().contains(recordsFilePath())) {
        m_watcher->addPath(recordsFilePath());
    }

    QMap<QString, QString> subscriptions;
    qint64 lastSeen;
    {
        QMutexLocker locker(&m_mutex);
        subscriptions = m_subscriptions;
        lastSeen = qMax<qint64>(0, m_lastSeenSeq);
    }
    if (subscriptions.isEmpty()) {
        return;
    }

    QJsonObject root;
    QString error;
    if (!readJson(recordsFilePath(), &root, &error)) {
        qWarning() << "[FolderRemote]" << error;
        return;
    }
    ServerState state = parseServerState(root);
    if (state.seq <= lastSeen) {
        return;
    }

    QSet<QString> changedKinds;
    for (const ServerRecord &entry : std::as_const(state.records)) {
        if (entry.serverSeq > lastSeen && entry.lastWriter != m_deviceId) {
            changedKinds.insert(entry.record.kind);
        }
    }

    {
        QMutexLocker locker(&m_mutex);
        m_lastSeenSeq = qMax(m_lastSeenSeq, state.seq);
    }

    for (auto it = subscriptions.constBegin(); it != subscriptions.constEnd(); ++it) {
        if (!changedKinds.contains(it.value())) {
            continue;
        }
        QVariantMap payload;
        payload["type"] = "query";
        payload["subscriptionId"] = it.key();
        payload["recordKind"] = it.value();
        qDebug() << "[FolderRemote]" << m_deviceId << "notifying change in" << it.value();
        emit notificationReceived(payload);
    }
}

} // namespace LedgerSync
