#include "profile.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QUuid>

const int Profile::DEFAULT_CONVERGENCE_TIMEOUT_MS = 30000;
const int Profile::DEFAULT_POLL_INTERVAL_MS = 1000;
const int Profile::DEFAULT_STABLE_SAMPLES = 3;

Profile::Profile(const QString &dataFolderPath)
    : m_dataFolderPath(dataFolderPath)
    , m_convergenceTimeoutMs(DEFAULT_CONVERGENCE_TIMEOUT_MS)
    , m_pollIntervalMs(DEFAULT_POLL_INTERVAL_MS)
    , m_stableSamples(DEFAULT_STABLE_SAMPLES)
{
    // Try to load existing settings if path is set
    if (!m_dataFolderPath.isEmpty()) {
        load();
    }
}

void Profile::setDataFolderPath(const QString &path)
{
    m_dataFolderPath = path;
}

QString Profile::name() const
{
    if (!m_name.isEmpty()) {
        return m_name;
    }
    // Default to folder name
    if (!m_dataFolderPath.isEmpty()) {
        return QFileInfo(m_dataFolderPath).fileName();
    }
    return QString();
}

void Profile::setName(const QString &name)
{
    m_name = name;
}

void Profile::setDeviceId(const QString &id)
{
    m_deviceId = id;
}

bool Profile::isValid() const
{
    if (m_dataFolderPath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_dataFolderPath);
    return info.exists() && info.isDir() && info.isWritable();
}

bool Profile::exists() const
{
    return QFile::exists(configFilePath());
}

// ========== Remote Settings ==========

void Profile::setRemoteAccountFolder(const QString &path)
{
    m_remoteAccountFolder = path.isEmpty() ? QString() : QDir::cleanPath(path);
}

// ========== Convergence Settings ==========

void Profile::setConvergenceTimeoutMs(int ms)
{
    m_convergenceTimeoutMs = ms > 0 ? ms : DEFAULT_CONVERGENCE_TIMEOUT_MS;
}

void Profile::setPollIntervalMs(int ms)
{
    m_pollIntervalMs = ms > 0 ? ms : DEFAULT_POLL_INTERVAL_MS;
}

void Profile::setStableSamples(int samples)
{
    // Two samples can only prove one interval of quiet
    m_stableSamples = samples >= 2 ? samples : DEFAULT_STABLE_SAMPLES;
}

// ========== Persistence ==========

bool Profile::load()
{
    if (!exists()) {
        return false;
    }

    QSettings settings(configFilePath(), QSettings::IniFormat);

    m_name = settings.value("profile/name").toString();
    m_deviceId = settings.value("profile/deviceId").toString();

    setRemoteAccountFolder(settings.value("remote/accountFolder").toString());

    setConvergenceTimeoutMs(settings.value("convergence/timeoutMs",
                                           DEFAULT_CONVERGENCE_TIMEOUT_MS).toInt());
    setPollIntervalMs(settings.value("convergence/pollIntervalMs",
                                     DEFAULT_POLL_INTERVAL_MS).toInt());
    setStableSamples(settings.value("convergence/stableSamples",
                                    DEFAULT_STABLE_SAMPLES).toInt());

    return settings.status() == QSettings::NoError;
}

bool Profile::save()
{
    if (m_dataFolderPath.isEmpty()) {
        return false;
    }

    // Ensure directory exists
    QDir dir(m_dataFolderPath);
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    QSettings settings(configFilePath(), QSettings::IniFormat);

    if (!m_name.isEmpty()) {
        settings.setValue("profile/name", m_name);
    }
    if (!m_deviceId.isEmpty()) {
        settings.setValue("profile/deviceId", m_deviceId);
    }

    if (m_remoteAccountFolder.isEmpty()) {
        settings.remove("remote/accountFolder");
    } else {
        settings.setValue("remote/accountFolder", m_remoteAccountFolder);
    }

    settings.setValue("convergence/timeoutMs", m_convergenceTimeoutMs);
    settings.setValue("convergence/pollIntervalMs", m_pollIntervalMs);
    settings.setValue("convergence/stableSamples", m_stableSamples);

    settings.sync();
    return settings.status() == QSettings::NoError;
}

bool Profile::initialize()
{
    if (m_dataFolderPath.isEmpty()) {
        return false;
    }

    QDir dir(m_dataFolderPath);

    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    dir.mkpath("store");

    if (m_deviceId.isEmpty()) {
        m_deviceId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

    return save();
}

QString Profile::configFilePath() const
{
    if (m_dataFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_dataFolderPath).filePath(".ledgersync.conf");
}

QString Profile::storeDirectoryPath() const
{
    if (m_dataFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_dataFolderPath).filePath("store");
}

QString Profile::replicationConfigPath() const
{
    if (m_dataFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_dataFolderPath).filePath("replication.json");
}
