#include "jsonfilestore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QDebug>

namespace LedgerSync {

const QString JsonFileStore::FORMAT = QStringLiteral("ledgersync-store");

JsonFileStore::JsonFileStore(const QString &directory,
                             const StoreSchema &schema,
                             QObject *parent)
    : LocalStore(schema, parent)
    , m_directory(directory)
{
}

QString JsonFileStore::storeFilePath() const
{
    return QDir(m_directory).filePath("store.json");
}

QString JsonFileStore::bindingFilePath() const
{
    return QDir(m_directory).filePath("binding.json");
}

bool JsonFileStore::fail(ErrorKind kind, const QString &message)
{
    m_lastError = kind;
    reportError(message);
    return false;
}

bool JsonFileStore::open(bool replicating, const QString &containerIdentifier)
{
    m_open = false;
    m_lastError = ErrorKind::None;

    if (m_directory.isEmpty()) {
        return fail(ErrorKind::StorageError, "No store directory configured");
    }

    QDir dir(m_directory);
    if (!dir.exists() && !dir.mkpath(".")) {
        return fail(ErrorKind::StorageError,
                    QString("Failed to create store directory: %1").arg(m_directory));
    }

    const bool existed = QFileInfo::exists(storeFilePath());
    if (existed && !load()) {
        return false;
    }

    if (replicating && !bind(containerIdentifier)) {
        return false;
    }

    setReplicating(replicating);

    if (!existed) {
        QWriteLocker locker(&m_lock);
        if (!persist()) {
            locker.unlock();
            return fail(ErrorKind::StorageError,
                        QString("Failed to create %1").arg(storeFilePath()));
        }
    }

    m_open = true;
    qDebug() << "[JsonFileStore] Opened" << m_directory
             << "schema" << schema().name() << "v" << schema().version()
             << (replicating ? "(replicating)" : "(local only)");
    return true;
}

bool JsonFileStore::load()
{
    QFile file(storeFilePath());
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(ErrorKind::StorageError,
                    QString("Cannot read %1: %2").arg(file.fileName(), file.errorString()));
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return fail(ErrorKind::StorageError,
                    QString("Corrupt store file %1: %2")
                        .arg(file.fileName(), parseError.errorString()));
    }

    QJsonObject root = doc.object();
    if (root["format"].toString() != FORMAT) {
        return fail(ErrorKind::StorageError,
                    QString("Unrecognized store format in %1").arg(file.fileName()));
    }

    const int version = root["schemaVersion"].toInt();
    if (version != schema().version()) {
        return fail(ErrorKind::SchemaIncompatible,
                    QString("Store schema version %1, expected %2")
                        .arg(version).arg(schema().version()));
    }

    const QJsonArray kinds = root["kinds"].toArray();
    for (const QJsonValue &kind : kinds) {
        if (!schema().contains(kind.toString())) {
            return fail(ErrorKind::SchemaIncompatible,
                        QString("Store holds kind %1 unknown to the %2 schema")
                            .arg(kind.toString(), schema().name()));
        }
    }

    QMap<QString, SyncRecord> records;
    const QJsonArray recordArray = root["records"].toArray();
    for (const QJsonValue &value : recordArray) {
        SyncRecord record = SyncRecord::fromJson(value.toObject());
        if (!record.isValid() || !schema().contains(record.kind)) {
            qWarning() << "[JsonFileStore] Skipping unusable record in" << file.fileName();
            continue;
        }
        records.insert(record.key(), record);
    }

    QMap<QString, qint64> outbox;
    const QJsonObject outboxObject = root["outbox"].toObject();
    for (auto it = outboxObject.constBegin(); it != outboxObject.constEnd(); ++it) {
        if (records.contains(it.key())) {
            outbox.insert(it.key(), static_cast<qint64>(it.value().toDouble()));
        }
    }

    const qint64 token = static_cast<qint64>(root["pullToken"].toDouble());
    resetState(records, outbox, token);

    qDebug() << "[JsonFileStore] Loaded" << records.size() << "records,"
             << outbox.size() << "pending from" << file.fileName();
    return true;
}

bool JsonFileStore::bind(const QString &containerIdentifier)
{
    if (containerIdentifier.isEmpty()) {
        return fail(ErrorKind::Configuration,
                    "Replication requested without a container identifier");
    }

    QFile existing(bindingFilePath());
    if (existing.exists()) {
        if (!existing.open(QIODevice::ReadOnly)) {
            return fail(ErrorKind::StorageError,
                        QString("Cannot read %1").arg(existing.fileName()));
        }
        QJsonDocument doc = QJsonDocument::fromJson(existing.readAll());
        existing.close();

        const QString bound = doc.object()["container"].toString();
        if (!bound.isEmpty() && bound != containerIdentifier) {
            return fail(ErrorKind::Configuration,
                        QString("Store is bound to container %1, not %2")
                            .arg(bound, containerIdentifier));
        }
        if (bound == containerIdentifier) {
            return true;
        }
    }

    QJsonObject binding;
    binding["container"] = containerIdentifier;

    QSaveFile file(bindingFilePath());
    if (!file.open(QIODevice::WriteOnly)) {
        return fail(ErrorKind::StorageError,
                    QString("Cannot write %1").arg(file.fileName()));
    }
    file.write(QJsonDocument(binding).toJson());
    if (!file.commit()) {
        return fail(ErrorKind::StorageError,
                    QString("Cannot write %1").arg(bindingFilePath()));
    }
    return true;
}

bool JsonFileStore::persist()
{
    QJsonObject root;
    root["format"] = FORMAT;
    root["schemaVersion"] = schema().version();
    root["kinds"] = QJsonArray::fromStringList(schema().kinds());

    QJsonArray recordArray;
    for (const SyncRecord &record : std::as_const(m_records)) {
        recordArray.append(record.toJson());
    }
    root["records"] = recordArray;

    QJsonObject outboxObject;
    for (auto it = m_outbox.constBegin(); it != m_outbox.constEnd(); ++it) {
        outboxObject[it.key()] = static_cast<double>(it.value());
    }
    root["outbox"] = outboxObject;
    root["pullToken"] = static_cast<double>(m_pullToken);

    QSaveFile file(storeFilePath());
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[JsonFileStore] Cannot open" << file.fileName() << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        qWarning() << "[JsonFileStore] Commit failed for" << storeFilePath();
        return false;
    }
    return true;
}

bool JsonFileStore::destroy(const QString &directory, QString *errorMessage)
{
    QDir dir(directory);
    if (!dir.exists()) {
        return true;
    }

    const QStringList files = {"store.json", "binding.json"};
    for (const QString &name : files) {
        if (dir.exists(name) && !dir.remove(name)) {
            if (errorMessage) {
                *errorMessage = QString("Cannot remove %1").arg(dir.filePath(name));
            }
            return false;
        }
    }
    qDebug() << "[JsonFileStore] Destroyed store in" << directory;
    return true;
}

} // namespace LedgerSync
