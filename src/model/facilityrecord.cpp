#include "facilityrecord.h"

namespace Fbo {

const QString FacilityRecord::ImportLabel = QStringLiteral("baseline-import");

bool FacilityRecord::isInteractiveSource() const
{
    return !updatedBy.isEmpty() && updatedBy != ImportLabel;
}

bool FacilityRecord::hasReportedFuelPrice() const
{
    if (!hasFuelPrice()) {
        return false;
    }
    if (!fuelPriceReporter.isEmpty() && fuelPriceReporter != ImportLabel) {
        return true;
    }
    return isInteractiveSource();
}

bool FacilityRecord::isValidLocationCode(const QString &code)
{
    const QString normalized = code.trimmed().toUpper();
    if (normalized.length() < 3 || normalized.length() > 4) {
        return false;
    }
    for (const QChar &c : normalized) {
        if (!c.isLetterOrNumber()) {
            return false;
        }
    }
    return true;
}

void FacilityRecord::normalizeFuelPair()
{
    if (!hasFuelPrice()) {
        fuelPriceDate = QDateTime();
        fuelPriceReporter.clear();
        return;
    }

    if (!fuelPriceDate.isValid()) {
        if (lastUpdated.isValid()) {
            fuelPriceDate = lastUpdated;
        } else {
            // Nothing to date the price with
            jetAPrice.reset();
            avgasPrice.reset();
            fuelPriceReporter.clear();
        }
    }
}

QString FacilityRecord::amenitiesSummary() const
{
    QStringList items;
    if (hasCrewCars) items << "Crew Cars";
    if (hasCrewLounge) items << "Lounge";
    if (hasCatering) items << "Catering";
    if (hasMaintenance) items << "Mx";
    if (hasHangars) items << "Hangars";
    if (hasDeice) items << "Deice";
    if (hasOxygen) items << "Oxygen";
    if (hasGPU) items << "GPU";
    if (hasLav) items << "Lav";
    return items.join(", ");
}

QString FacilityRecord::description() const
{
    return QString("%1/%2").arg(locationCode, name);
}

bool FacilityRecord::operator==(const FacilityRecord &other) const
{
    return locationCode == other.locationCode
        && name == other.name
        && phoneNumber == other.phoneNumber
        && radioFrequency == other.radioFrequency
        && website == other.website
        && jetAPrice == other.jetAPrice
        && avgasPrice == other.avgasPrice
        && fuelPriceDate == other.fuelPriceDate
        && fuelPriceReporter == other.fuelPriceReporter
        && hasCrewCars == other.hasCrewCars
        && hasCrewLounge == other.hasCrewLounge
        && hasCatering == other.hasCatering
        && hasMaintenance == other.hasMaintenance
        && hasHangars == other.hasHangars
        && hasDeice == other.hasDeice
        && hasOxygen == other.hasOxygen
        && hasGPU == other.hasGPU
        && hasLav == other.hasLav
        && handlingFee == other.handlingFee
        && overnightFee == other.overnightFee
        && rampFee == other.rampFee
        && rampFeeWaived == other.rampFeeWaived
        && averageRating == other.averageRating
        && ratingCount == other.ratingCount
        && lastUpdated == other.lastUpdated
        && updatedBy == other.updatedBy
        && remoteId == other.remoteId
        && isVerified == other.isVerified
        && pendingUpload == other.pendingUpload;
}

} // namespace Fbo
