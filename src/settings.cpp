#include "settings.h"
#include <QDir>
#include <QStandardPaths>

Settings::Settings(const QString &filePath)
    : m_settings(filePath.isEmpty()
                     ? std::make_unique<QSettings>("LedgerSync", "LedgerSync")
                     : std::make_unique<QSettings>(filePath, QSettings::IniFormat))
{
}

Settings::~Settings()
{
    m_settings->sync();
}

// ========== Replication ==========

bool Settings::replicationEnabled() const
{
    return m_settings->value("replication/enabled", false).toBool();
}

void Settings::setReplicationEnabled(bool enabled)
{
    m_settings->setValue("replication/enabled", enabled);
}

bool Settings::hasReplicationPreference() const
{
    return m_settings->contains("replication/enabled");
}

bool Settings::replicationOfferDismissed() const
{
    return m_settings->value("replication/offerDismissed", false).toBool();
}

void Settings::setReplicationOfferDismissed(bool dismissed)
{
    m_settings->setValue("replication/offerDismissed", dismissed);
}

bool Settings::onboardingCompleted() const
{
    return m_settings->value("onboarding/completed", false).toBool();
}

void Settings::setOnboardingCompleted(bool completed)
{
    m_settings->setValue("onboarding/completed", completed);
}

// ========== Data Folder ==========

QString Settings::defaultDataFolder() const
{
    QString fallback = QDir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation))
                           .filePath("default");
    return m_settings->value("data/defaultFolder", fallback).toString();
}

void Settings::setDefaultDataFolder(const QString &path)
{
    m_settings->setValue("data/defaultFolder", QDir::cleanPath(path));
}

// ========== Advanced Settings ==========

bool Settings::debugLogging() const
{
    return m_settings->value("advanced/debugLogging", false).toBool();
}

void Settings::setDebugLogging(bool enabled)
{
    m_settings->setValue("advanced/debugLogging", enabled);
}

void Settings::sync()
{
    m_settings->sync();
}
