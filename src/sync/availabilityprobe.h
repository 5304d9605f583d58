#ifndef AVAILABILITYPROBE_H
#define AVAILABILITYPROBE_H

#include <QString>

namespace LedgerSync {

/**
 * @brief Decides whether remote replication is configured for this install
 *
 * The decision is resolved once, at construction, from local
 * configuration only:
 *   1. replication.json in the data folder ({"containerIdentifier": "..."})
 *   2. the identifier bound at build time (LEDGERSYNC_CONTAINER_ID)
 *
 * No network I/O, no exceptions. A missing or malformed configuration
 * file is not an error; it simply falls through to the next check.
 */
class AvailabilityProbe
{
public:
    enum class Source {
        None,               ///< No valid identifier anywhere
        ConfigFile,         ///< Identifier read from replication.json
        BuildConfiguration  ///< Identifier compiled into the binary
    };

    /**
     * @param configFilePath Path to replication.json, may be empty
     * @param buildIdentifier Identifier bound at build time
     */
    explicit AvailabilityProbe(const QString &configFilePath = QString(),
                               const QString &buildIdentifier = builtInIdentifier());

    bool isAvailable() const { return m_source != Source::None; }

    QString containerIdentifier() const { return m_identifier; }
    Source source() const { return m_source; }

    static bool isValidIdentifier(const QString &identifier);

    /**
     * @brief Identifier from the generated version header
     */
    static QString builtInIdentifier();

    /**
     * @brief Write a replication.json for the given identifier
     * @return false if the identifier is invalid or the file can't be written
     */
    static bool writeConfigFile(const QString &path, const QString &identifier);

private:
    static QString readConfigIdentifier(const QString &path);

    QString m_identifier;
    Source m_source = Source::None;
};

} // namespace LedgerSync

#endif // AVAILABILITYPROBE_H
