#ifndef DEDUPLICATOR_H
#define DEDUPLICATOR_H

#include <QList>
#include "../model/facilityrecord.h"

namespace Fbo {

/**
 * @brief Collapses same-location records whose normalized names collide
 *
 * Selection only: the winner of a group is kept as-is and the others are
 * dropped. Field-level merging happens earlier, in the Reconciler, where
 * the provenance of each side is known.
 *
 * Winner rules, in order:
 *   1. a verified record beats an unverified one
 *   2. otherwise the strictly newer lastUpdated wins
 *   3. otherwise the first record encountered stays
 */
class Deduplicator
{
public:
    /**
     * @brief One record per normalized name, sorted by name (ordinal)
     */
    static FacilityList deduplicate(const FacilityList &records);

    /**
     * @brief Groups with more than one member, in first-seen order
     *
     * The group winner is always at index 0.
     */
    static QList<FacilityList> duplicateGroups(const FacilityList &records);

    /**
     * @brief Whether candidate should replace current as group winner
     */
    static bool isPreferred(const FacilityRecord &candidate, const FacilityRecord &current);

    /**
     * @brief Sort by name, case-sensitive ordinal, stable
     */
    static void sortByName(FacilityList &records);

private:
    static QList<FacilityList> groupByKey(const FacilityList &records);
};

} // namespace Fbo

#endif // DEDUPLICATOR_H
