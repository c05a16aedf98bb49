#ifndef RECONCILER_H
#define RECONCILER_H

#include "../model/facilityrecord.h"
#include "synctypes.h"

namespace Fbo {

/**
 * @brief Merges an incoming collection into a local one for one location
 *
 * Local records are keyed by normalized name. Each incoming record either
 * merges into its key match through FieldMergePolicy or is added as a
 * facility only the incoming side knows about. The result goes through
 * Deduplicator as a final safety net and comes back sorted by name.
 *
 * The result depends on provenance: the same incoming data merges
 * differently when it carries the bulk-import label than when it comes
 * from an interactive source. No side effects; callers persist.
 */
class Reconciler
{
public:
    static FacilityList reconcile(const FacilityList &local,
                                  const FacilityList &incoming);

    /**
     * @brief reconcile() that also counts created/updated/unchanged records
     */
    static FacilityList reconcile(const FacilityList &local,
                                  const FacilityList &incoming,
                                  SyncStats &stats);
};

} // namespace Fbo

#endif // RECONCILER_H
