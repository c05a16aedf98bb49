#include "fieldmergepolicy.h"

namespace Fbo {

namespace {

template<typename T>
void mergeValue(T &target, const T &incoming, bool incomingWins)
{
    if (incoming.has_value() && (incomingWins || !target.has_value())) {
        target = incoming;
    }
}

void mergeString(QString &target, const QString &incoming, bool incomingWins)
{
    if (!incoming.isEmpty() && (incomingWins || target.isEmpty())) {
        target = incoming;
    }
}

// Invalid dates count as the earliest possible instant
bool isStrictlyNewer(const QDateTime &candidate, const QDateTime &reference)
{
    if (!candidate.isValid()) {
        return false;
    }
    if (!reference.isValid()) {
        return true;
    }
    return candidate > reference;
}

} // namespace

bool FieldMergePolicy::incomingTakesPrecedence(const FacilityRecord &existing,
                                               const FacilityRecord &incoming)
{
    if (!incoming.isInteractiveSource()) {
        return false;
    }

    if (existing.isInteractiveSource()) {
        // Both sides are user data: the more recent edit wins
        return !isStrictlyNewer(existing.lastUpdated, incoming.lastUpdated);
    }

    return true;
}

bool FieldMergePolicy::incomingFuelWins(const FacilityRecord &existing,
                                        const FacilityRecord &incoming)
{
    // Never adopt a price without its date, or a date without a price
    if (!incoming.hasFuelPrice() || !incoming.fuelPriceDate.isValid()) {
        return false;
    }

    // A dataset refresh never replaces a price a user reported
    if (incoming.isImported() && existing.hasReportedFuelPrice()) {
        return false;
    }

    if (isStrictlyNewer(incoming.fuelPriceDate, existing.fuelPriceDate)) {
        return true;
    }

    // A price beats no price at all
    return !existing.hasFuelPrice();
}

FacilityRecord FieldMergePolicy::mergeFields(const FacilityRecord &existing,
                                             const FacilityRecord &incoming)
{
    FacilityRecord merged = existing;
    const bool incomingWins = incomingTakesPrecedence(existing, incoming);

    // Identity: keep existing's name to avoid cosmetic churn
    if (!incoming.remoteId.isEmpty()) {
        merged.remoteId = incoming.remoteId;
    }

    // Contact
    mergeString(merged.phoneNumber, incoming.phoneNumber, incomingWins);
    mergeString(merged.radioFrequency, incoming.radioFrequency, incomingWins);
    mergeString(merged.website, incoming.website, incomingWins);

    // Fees
    mergeValue(merged.handlingFee, incoming.handlingFee, incomingWins);
    mergeValue(merged.overnightFee, incoming.overnightFee, incomingWins);
    if (incoming.rampFee.has_value() && (incomingWins || !merged.rampFee.has_value())) {
        merged.rampFee = incoming.rampFee;
        merged.rampFeeWaived = incoming.rampFeeWaived;
    }

    // Ratings
    if (incoming.hasRating() && (incomingWins || !merged.hasRating())) {
        merged.averageRating = incoming.averageRating;
        merged.ratingCount = incoming.ratingCount;
    }

    // Amenities
    merged.hasCrewCars = existing.hasCrewCars || incoming.hasCrewCars;
    merged.hasCrewLounge = existing.hasCrewLounge || incoming.hasCrewLounge;
    merged.hasCatering = existing.hasCatering || incoming.hasCatering;
    merged.hasMaintenance = existing.hasMaintenance || incoming.hasMaintenance;
    merged.hasHangars = existing.hasHangars || incoming.hasHangars;
    merged.hasDeice = existing.hasDeice || incoming.hasDeice;
    merged.hasOxygen = existing.hasOxygen || incoming.hasOxygen;
    merged.hasGPU = existing.hasGPU || incoming.hasGPU;
    merged.hasLav = existing.hasLav || incoming.hasLav;

    // Fuel price group
    if (incomingFuelWins(existing, incoming)) {
        merged.jetAPrice = incoming.jetAPrice;
        merged.avgasPrice = incoming.avgasPrice;
        merged.fuelPriceDate = incoming.fuelPriceDate;
        merged.fuelPriceReporter = incoming.fuelPriceReporter;
    }

    // Provenance
    merged.isVerified = existing.isVerified || incoming.isVerified;
    merged.pendingUpload = existing.pendingUpload || incoming.pendingUpload;
    const bool importOverUser = incoming.isImported() && existing.isInteractiveSource();
    if (!importOverUser && isStrictlyNewer(incoming.lastUpdated, existing.lastUpdated)) {
        merged.lastUpdated = incoming.lastUpdated;
    }
    if (incomingWins || merged.updatedBy.isEmpty()) {
        merged.updatedBy = incoming.updatedBy;
    }

    return merged;
}

} // namespace Fbo
