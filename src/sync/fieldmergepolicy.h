#ifndef FIELDMERGEPOLICY_H
#define FIELDMERGEPOLICY_H

#include "../model/facilityrecord.h"

namespace Fbo {

/**
 * @brief Merges two records already known to describe the same facility
 *
 * Pure and deterministic. Each field group is decided independently:
 *
 *   - identity: existing's location code and name; remoteId from incoming
 *     when set, otherwise existing's
 *   - contact, fees, ratings: incoming's non-null values win when incoming
 *     comes from an interactive source, otherwise existing wins and
 *     incoming only fills gaps. When both sides are interactive and both
 *     values are set, the newer lastUpdated wins (incoming on a tie).
 *     The ramp fee moves together with its waived flag, the rating
 *     average together with its count.
 *   - amenities: logical OR, never regresses to false
 *   - fuel: the strictly newer fuelPriceDate wins as a unit (prices, date,
 *     reporter); a side without any price adopts the other side's price
 *   - isVerified, pendingUpload: logical OR
 *   - lastUpdated: the later of the two
 */
class FieldMergePolicy
{
public:
    static FacilityRecord mergeFields(const FacilityRecord &existing,
                                      const FacilityRecord &incoming);

    /**
     * @brief Whether incoming's values should replace existing's non-null values
     */
    static bool incomingTakesPrecedence(const FacilityRecord &existing,
                                        const FacilityRecord &incoming);

    /**
     * @brief Whether incoming's fuel price group replaces existing's
     */
    static bool incomingFuelWins(const FacilityRecord &existing,
                                 const FacilityRecord &incoming);
};

} // namespace Fbo

#endif // FIELDMERGEPOLICY_H
