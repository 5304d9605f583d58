#ifndef JSONFILESTORE_H
#define JSONFILESTORE_H

#include "localstore.h"

namespace LedgerSync {

/**
 * @brief Durable store backed by a JSON document in a directory
 *
 * Layout:
 *   <directory>/store.json     records, outbox and pull token
 *   <directory>/binding.json   container the store replicates with
 *
 * Every write replaces store.json atomically. A store opened for
 * replication is bound to one container; opening it later with a
 * different container fails with a configuration error.
 */
class JsonFileStore : public LocalStore
{
    Q_OBJECT

public:
    JsonFileStore(const QString &directory,
                  const StoreSchema &schema,
                  QObject *parent = nullptr);

    QString storeId() const override { return QStringLiteral("json-file"); }
    bool isPersistent() const override { return true; }

    /**
     * @brief Load the store, creating it if it does not exist yet
     * @param replicating Open in replication mode
     * @param containerIdentifier Required when replicating
     * @return false on failure; see lastError() and errorString()
     */
    bool open(bool replicating, const QString &containerIdentifier = QString());

    bool isOpen() const { return m_open; }
    ErrorKind lastError() const { return m_lastError; }

    QString directory() const { return m_directory; }
    QString storeFilePath() const;
    QString bindingFilePath() const;

    /**
     * @brief Delete all store files under a directory
     */
    static bool destroy(const QString &directory, QString *errorMessage = nullptr);

    static const QString FORMAT;

protected:
    bool persist() override;

private:
    bool fail(ErrorKind kind, const QString &message);
    bool load();
    bool bind(const QString &containerIdentifier);

    QString m_directory;
    bool m_open = false;
    ErrorKind m_lastError = ErrorKind::None;
};

} // namespace LedgerSync

#endif // JSONFILESTORE_H
