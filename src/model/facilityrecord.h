#ifndef FACILITYRECORD_H
#define FACILITYRECORD_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <optional>

namespace Fbo {

/**
 * @brief One ground-service provider (FBO) at one airport
 *
 * Plain value type. Every optional field uses either a null/empty QString,
 * an invalid QDateTime or an empty std::optional to mean "not known".
 *
 * Fuel prices only make sense together with fuelPriceDate: the pair
 * (jetAPrice/avgasPrice, fuelPriceDate, fuelPriceReporter) is always set
 * or cleared as a unit, see normalizeFuelPair().
 */
struct FacilityRecord
{
    /// updatedBy label reserved for rows created by the bundled dataset import
    static const QString ImportLabel;

    // Identity
    QString locationCode;       ///< Airport identifier, uppercase, 3-4 chars
    QString name;               ///< Free-text facility name

    // Contact
    QString phoneNumber;
    QString radioFrequency;     ///< UNICOM / ASRI frequency
    QString website;

    // Fuel
    std::optional<double> jetAPrice;
    std::optional<double> avgasPrice;
    QDateTime fuelPriceDate;
    QString fuelPriceReporter;

    // Amenities (additive: once true from any source, stays true)
    bool hasCrewCars = false;
    bool hasCrewLounge = false;
    bool hasCatering = false;
    bool hasMaintenance = false;
    bool hasHangars = false;
    bool hasDeice = false;
    bool hasOxygen = false;
    bool hasGPU = false;
    bool hasLav = false;

    // Fees
    std::optional<double> handlingFee;
    std::optional<double> overnightFee;
    std::optional<double> rampFee;
    bool rampFeeWaived = false;     ///< Only meaningful with rampFee

    // Backend-derived ratings
    std::optional<double> averageRating;
    std::optional<int> ratingCount;

    // Provenance
    QDateTime lastUpdated;
    QString updatedBy;
    QString remoteId;               ///< Set once the record has been synced
    bool isVerified = false;

    /// Local-only: created or edited here and not yet pushed upstream
    bool pendingUpload = false;

    bool hasFuelPrice() const { return jetAPrice.has_value() || avgasPrice.has_value(); }
    bool hasRating() const { return averageRating.has_value() || ratingCount.has_value(); }
    bool isImported() const { return updatedBy == ImportLabel; }

    /**
     * @brief Whether the fuel price group came from a user, not the dataset
     *
     * True when a price is present and either its reporter or the record's
     * updatedBy names an interactive source.
     */
    bool hasReportedFuelPrice() const;

    /**
     * @brief 3-4 letters or digits after trimming and uppercasing
     */
    static bool isValidLocationCode(const QString &code);

    /**
     * @brief Whether updatedBy names an interactive source
     *
     * True for a user/device/backend label, false for an empty label or
     * the reserved import label.
     */
    bool isInteractiveSource() const;

    /**
     * @brief Enforce the price/timestamp pairing
     *
     * A price without a date borrows lastUpdated (or is dropped when that
     * is invalid too). No price clears the date and the reporter.
     */
    void normalizeFuelPair();

    /**
     * @brief Short list of confirmed amenities, e.g. "Crew Cars, Lounge"
     */
    QString amenitiesSummary() const;

    /**
     * @brief Human-readable identity for logs
     */
    QString description() const;

    bool operator==(const FacilityRecord &other) const;
    bool operator!=(const FacilityRecord &other) const { return !(*this == other); }
};

using FacilityList = QList<FacilityRecord>;

} // namespace Fbo

Q_DECLARE_METATYPE(Fbo::FacilityRecord)

#endif // FACILITYRECORD_H
