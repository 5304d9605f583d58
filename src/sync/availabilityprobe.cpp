#include "availabilityprobe.h"
#include "ledgersync_version.h"

#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QDebug>

namespace LedgerSync {

AvailabilityProbe::AvailabilityProbe(const QString &configFilePath,
                                     const QString &buildIdentifier)
{
    QString fromConfig = readConfigIdentifier(configFilePath);
    if (isValidIdentifier(fromConfig)) {
        m_identifier = fromConfig;
        m_source = Source::ConfigFile;
    } else if (isValidIdentifier(buildIdentifier)) {
        m_identifier = buildIdentifier;
        m_source = Source::BuildConfiguration;
    }

    qDebug() << "[AvailabilityProbe] Container ID:"
             << (m_identifier.isEmpty() ? QString("<none>") : m_identifier)
             << "available:" << isAvailable();
}

bool AvailabilityProbe::isValidIdentifier(const QString &identifier)
{
    static const QRegularExpression pattern("^[A-Za-z0-9][A-Za-z0-9._-]*$");
    return !identifier.isEmpty() && pattern.match(identifier).hasMatch();
}

QString AvailabilityProbe::builtInIdentifier()
{
    return QString::fromUtf8(LEDGERSYNC_CONTAINER_ID).trimmed();
}

QString AvailabilityProbe::readConfigIdentifier(const QString &path)
{
    if (path.isEmpty()) {
        return QString();
    }

    QFile file(path);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        return QString();
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[AvailabilityProbe] Ignoring malformed" << path
                   << parseError.errorString();
        return QString();
    }

    return doc.object().value("containerIdentifier").toString().trimmed();
}

bool AvailabilityProbe::writeConfigFile(const QString &path, const QString &identifier)
{
    if (path.isEmpty() || !isValidIdentifier(identifier)) {
        return false;
    }

    QJsonObject root;
    root["containerIdentifier"] = identifier;

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return file.commit();
}

} // namespace LedgerSync
