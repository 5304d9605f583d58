#include "storeschema.h"
#include "model/recordkinds.h"

namespace LedgerSync {

const int StoreSchema::CURRENT_VERSION = 2;

StoreSchema::StoreSchema(const QString &name, int version, const QStringList &kinds)
    : m_name(name)
    , m_version(version)
    , m_kinds(kinds)
{
}

StoreSchema StoreSchema::full()
{
    return StoreSchema("full", CURRENT_VERSION, Records::allKinds());
}

StoreSchema StoreSchema::minimal()
{
    return StoreSchema("minimal", CURRENT_VERSION, Records::minimalKinds());
}

} // namespace LedgerSync
