#ifndef FOLDERREMOTE_H
#define FOLDERREMOTE_H

#include <QMutex>
#include <QJsonObject>

#include "remotecollaborator.h"

class QFileSystemWatcher;

namespace LedgerSync {

/**
 * @brief Remote account kept in a shared directory
 *
 * Several processes (devices) pointing at the same directory replicate
 * through it. Layout:
 *
 *   <root>/account.json         account state ("available", "restricted")
 *   <root>/records.json         every record with its server sequence
 *   <root>/subscriptions.json   subscriptions per device
 *   <root>/.lock                QLockFile held during every read-modify-write
 *
 * records.json is replaced atomically, so a push either lands as a whole
 * or not at all. Changes written by other devices are picked up with a
 * QFileSystemWatcher and reported as query notifications for subscribed
 * kinds.
 */
class FolderRemote : public RemoteCollaborator
{
    Q_OBJECT

public:
    FolderRemote(const QString &rootPath,
                 const QString &deviceId,
                 QObject *parent = nullptr);
    ~FolderRemote() override;

    QString remoteId() const override { return QStringLiteral("folder"); }
    QString rootPath() const { return m_rootPath; }
    QString deviceId() const { return m_deviceId; }

    AccountStatus accountStatus() override;

    RemoteResult<PushReport> push(const QList<SyncRecord> &records) override;
    RemoteResult<PullBatch> pull(qint64 sinceToken) override;
    RemoteResult<QMap<QString, int>> recordCounts() override;

    RemoteResult<SubscriptionDescriptor> subscribe(const QString &recordKind) override;
    RemoteResult<bool> unsubscribe(const QString &subscriptionId) override;

    /**
     * @brief Lock acquisition timeout in milliseconds (default 5000)
     */
    void setLockTimeout(int ms) { m_lockTimeoutMs = ms; }

    /**
     * @brief Create an empty account in a directory
     */
    static bool initializeAccount(const QString &rootPath, QString *errorMessage = nullptr);

    /**
     * @brief Subscription id used for a record kind
     */
    static QString subscriptionIdFor(const QString &recordKind);

public slots:
    /**
     * @brief Look for changes by other devices and notify
     *
     * Called by the file watcher; callable directly to poll.
     */
    void checkForChanges();

private:
    QString accountFilePath() const;
    QString recordsFilePath() const;
    QString subscriptionsFilePath() const;
    QString lockFilePath() const;

    bool readJson(const QString &path, QJsonObject *object, QString *error) const;
    bool writeJson(const QString &path, const QJsonObject &object, QString *error) const;
    void startWatching();

    QString m_rootPath;
    QString m_deviceId;
    int m_lockTimeoutMs = 5000;

    QFileSystemWatcher *m_watcher = nullptr;

    mutable QMutex m_mutex;
    QMap<QString, QString> m_subscriptions;     // subscription id -> kind
    qint64 m_lastSeenSeq = -1;
};

} // namespace LedgerSync

#endif // FOLDERREMOTE_H
