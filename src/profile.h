#ifndef PROFILE_H
#define PROFILE_H

#include <QString>

/**
 * @brief Profile represents one data folder with its replication settings
 *
 * Profile settings are stored in the data folder itself as
 * .ledgersync.conf, so the folder can be moved and its settings travel
 * with it.
 *
 * Each profile corresponds to:
 *   - A local store directory (store/)
 *   - An optional replication.json carrying the container identifier
 *   - A remote account folder used as the replication target
 *   - Convergence polling parameters
 */
class Profile
{
public:
    /**
     * @brief Create a profile for the given data folder path
     */
    explicit Profile(const QString &dataFolderPath = QString());

    // Profile location
    QString dataFolderPath() const { return m_dataFolderPath; }
    void setDataFolderPath(const QString &path);

    // Profile identity
    QString name() const;
    void setName(const QString &name);

    // Stable per-install id, generated by initialize()
    QString deviceId() const { return m_deviceId; }
    void setDeviceId(const QString &id);

    // Check if profile is valid (folder exists and is writable)
    bool isValid() const;

    // Check if profile config file exists
    bool exists() const;

    // ========== Remote Settings ==========

    QString remoteAccountFolder() const { return m_remoteAccountFolder; }
    void setRemoteAccountFolder(const QString &path);

    // ========== Convergence Settings ==========

    int convergenceTimeoutMs() const { return m_convergenceTimeoutMs; }
    void setConvergenceTimeoutMs(int ms);

    int pollIntervalMs() const { return m_pollIntervalMs; }
    void setPollIntervalMs(int ms);

    int stableSamples() const { return m_stableSamples; }
    void setStableSamples(int samples);

    // ========== Persistence ==========

    // Load settings from .ledgersync.conf in the data folder
    bool load();

    // Save settings to .ledgersync.conf in the data folder
    bool save();

    // Initialize a new profile (create directories, device id, default config)
    bool initialize();

    QString configFilePath() const;
    QString storeDirectoryPath() const;
    QString replicationConfigPath() const;

    static const int DEFAULT_CONVERGENCE_TIMEOUT_MS;
    static const int DEFAULT_POLL_INTERVAL_MS;
    static const int DEFAULT_STABLE_SAMPLES;

private:
    QString m_dataFolderPath;
    QString m_name;
    QString m_deviceId;
    QString m_remoteAccountFolder;

    int m_convergenceTimeoutMs;
    int m_pollIntervalMs;
    int m_stableSamples;
};

#endif // PROFILE_H
