#include "memorystore.h"

namespace LedgerSync {

MemoryStore::MemoryStore(const StoreSchema &schema, QObject *parent)
    : LocalStore(schema, parent)
{
}

} // namespace LedgerSync
