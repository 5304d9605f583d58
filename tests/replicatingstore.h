/**
 * @file replicatingstore.h
 * @brief Memory store that can be put in replication mode
 */

#ifndef REPLICATINGSTORE_H
#define REPLICATINGSTORE_H

#include "store/memorystore.h"

namespace LedgerSync {

class ReplicatingStore : public MemoryStore
{
public:
    explicit ReplicatingStore(const StoreSchema &schema = StoreSchema::full(),
                              bool replicating = true,
                              QObject *parent = nullptr)
        : MemoryStore(schema, parent)
    {
        setReplicating(replicating);
    }

    /**
     * @brief Makes every following write fail as if the disk were full
     */
    bool failPersist = false;

protected:
    bool persist() override { return !failPersist; }
};

} // namespace LedgerSync

#endif // REPLICATINGSTORE_H
