#ifndef MEMORYSTORE_H
#define MEMORYSTORE_H

#include "localstore.h"

namespace LedgerSync {

/**
 * @brief Store that keeps everything in memory
 *
 * Used when no durable store can be opened. Never replicates; data is
 * lost when the process exits.
 */
class MemoryStore : public LocalStore
{
    Q_OBJECT

public:
    explicit MemoryStore(const StoreSchema &schema, QObject *parent = nullptr);

    QString storeId() const override { return QStringLiteral("memory"); }
    bool isPersistent() const override { return false; }

protected:
    bool persist() override { return true; }
};

} // namespace LedgerSync

#endif // MEMORYSTORE_H
