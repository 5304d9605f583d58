#ifndef STORESCHEMA_H
#define STORESCHEMA_H

#include <QString>
#include <QStringList>

namespace LedgerSync {

/**
 * @brief Record kinds a store accepts, with a version for on-disk data
 *
 * A durable store written with a different version cannot be opened
 * and has to be recreated.
 */
class StoreSchema
{
public:
    StoreSchema() = default;
    StoreSchema(const QString &name, int version, const QStringList &kinds);

    static StoreSchema full();
    static StoreSchema minimal();

    QString name() const { return m_name; }
    int version() const { return m_version; }
    QStringList kinds() const { return m_kinds; }

    bool contains(const QString &kind) const { return m_kinds.contains(kind); }
    bool isValid() const { return m_version > 0 && !m_kinds.isEmpty(); }

    static const int CURRENT_VERSION;

private:
    QString m_name;
    int m_version = 0;
    QStringList m_kinds;
};

} // namespace LedgerSync

#endif // STORESCHEMA_H
