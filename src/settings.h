#ifndef SETTINGS_H
#define SETTINGS_H

#include <QString>
#include <QSettings>
#include <memory>

/**
 * @brief Device-local application settings using QSettings
 *
 * Persists user preferences that belong to this device, not to a data
 * folder. Data-folder settings (remote account, polling) live in Profile.
 *
 * Uses QSettings for platform-appropriate storage:
 *   - Linux: ~/.config/LedgerSync/LedgerSync.conf
 *   - Windows: Registry
 *   - macOS: plist
 *
 * Constructed by the application root and handed to whoever needs it;
 * tests pass an explicit INI file path.
 */
class Settings
{
public:
    /**
     * @param filePath INI file to use; empty selects the platform default
     */
    explicit Settings(const QString &filePath = QString());
    ~Settings();

    // ========== Replication ==========

    // Absence of a stored value reads as disabled
    bool replicationEnabled() const;
    void setReplicationEnabled(bool enabled);
    bool hasReplicationPreference() const;

    // Opt-in offer shown after onboarding
    bool replicationOfferDismissed() const;
    void setReplicationOfferDismissed(bool dismissed);

    bool onboardingCompleted() const;
    void setOnboardingCompleted(bool completed);

    // ========== Data Folder ==========

    QString defaultDataFolder() const;
    void setDefaultDataFolder(const QString &path);

    // ========== Advanced Settings ==========
    bool debugLogging() const;
    void setDebugLogging(bool enabled);

    // Sync to disk
    void sync();

    QString fileName() const { return m_settings->fileName(); }

private:
    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;

    std::unique_ptr<QSettings> m_settings;
};

#endif // SETTINGS_H
