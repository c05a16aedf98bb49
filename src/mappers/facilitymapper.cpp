#include "facilitymapper.h"

#include <QIODevice>
#include <QTextStream>
#include <QDebug>

namespace Fbo {

namespace {

enum Column {
    ColAirportCode = 0,
    ColName,
    ColPhone,
    ColUnicom,
    ColWebsite,
    ColJetAPrice,
    ColAvgasPrice,
    ColCrewCars,
    ColCrewLounge,
    ColCatering,
    ColMaintenance,
    ColHangars,
    ColDeice,
    ColOxygen,
    ColGpu,
    ColLav,
    ColHandlingFee,
    ColOvernightFee,
    ColRampFee,
    ColRampFeeWaived,
    ColumnCount
};

QString dateToString(const QDateTime &date)
{
    return date.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime dateFromString(const QString &text)
{
    if (text.isEmpty()) {
        return QDateTime();
    }
    QDateTime date = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!date.isValid()) {
        date = QDateTime::fromString(text, Qt::ISODate);
    }
    return date.toUTC();
}

void putString(QJsonObject &obj, const char *key, const QString &value)
{
    if (!value.isEmpty()) {
        obj[key] = value;
    }
}

void putAmount(QJsonObject &obj, const char *key, const std::optional<double> &value)
{
    if (value.has_value()) {
        obj[key] = *value;
    }
}

std::optional<double> takeAmount(const QJsonObject &obj, const char *key)
{
    const QJsonValue value = obj.value(key);
    if (!value.isDouble()) {
        return std::nullopt;
    }
    return value.toDouble();
}

} // namespace

FacilityMapper::FacilityMapper(QObject *parent)
    : QObject(parent)
{
}

FacilityMapper::~FacilityMapper()
{
}

// ========== JSON ==========

QJsonObject FacilityMapper::toJson(const FacilityRecord &record)
{
    QJsonObject obj;
    obj["locationCode"] = record.locationCode;
    obj["name"] = record.name;

    putString(obj, "phoneNumber", record.phoneNumber);
    putString(obj, "radioFrequency", record.radioFrequency);
    putString(obj, "website", record.website);

    putAmount(obj, "jetAPrice", record.jetAPrice);
    putAmount(obj, "avgasPrice", record.avgasPrice);
    if (record.fuelPriceDate.isValid()) {
        obj["fuelPriceDate"] = dateToString(record.fuelPriceDate);
    }
    putString(obj, "fuelPriceReporter", record.fuelPriceReporter);

    QJsonObject amenities;
    amenities["crewCars"] = record.hasCrewCars;
    amenities["crewLounge"] = record.hasCrewLounge;
    amenities["catering"] = record.hasCatering;
    amenities["maintenance"] = record.hasMaintenance;
    amenities["hangars"] = record.hasHangars;
    amenities["deice"] = record.hasDeice;
    amenities["oxygen"] = record.hasOxygen;
    amenities["gpu"] = record.hasGPU;
    amenities["lav"] = record.hasLav;
    obj["amenities"] = amenities;

    putAmount(obj, "handlingFee", record.handlingFee);
    putAmount(obj, "overnightFee", record.overnightFee);
    putAmount(obj, "rampFee", record.rampFee);
    if (record.rampFee.has_value()) {
        obj["rampFeeWaived"] = record.rampFeeWaived;
    }

    putAmount(obj, "averageRating", record.averageRating);
    if (record.ratingCount.has_value()) {
        obj["ratingCount"] = *record.ratingCount;
    }

    if (record.lastUpdated.isValid()) {
        obj["lastUpdated"] = dateToString(record.lastUpdated);
    }
    putString(obj, "updatedBy", record.updatedBy);
    putString(obj, "remoteId", record.remoteId);
    obj["isVerified"] = record.isVerified;
    if (record.pendingUpload) {
        obj["pendingUpload"] = true;
    }

    return obj;
}

FacilityRecord FacilityMapper::fromJson(const QJsonObject &json)
{
    FacilityRecord record;
    record.locationCode = json["locationCode"].toString().trimmed().toUpper();
    record.name = json["name"].toString();

    record.phoneNumber = json["phoneNumber"].toString();
    record.radioFrequency = json["radioFrequency"].toString();
    record.website = json["website"].toString();

    record.jetAPrice = takeAmount(json, "jetAPrice");
    record.avgasPrice = takeAmount(json, "avgasPrice");
    record.fuelPriceDate = dateFromString(json["fuelPriceDate"].toString());
    record.fuelPriceReporter = json["fuelPriceReporter"].toString();

    const QJsonObject amenities = json["amenities"].toObject();
    record.hasCrewCars = amenities["crewCars"].toBool();
    record.hasCrewLounge = amenities["crewLounge"].toBool();
    record.hasCatering = amenities["catering"].toBool();
    record.hasMaintenance = amenities["maintenance"].toBool();
    record.hasHangars = amenities["hangars"].toBool();
    record.hasDeice = amenities["deice"].toBool();
    record.hasOxygen = amenities["oxygen"].toBool();
    record.hasGPU = amenities["gpu"].toBool();
    record.hasLav = amenities["lav"].toBool();

    record.handlingFee = takeAmount(json, "handlingFee");
    record.overnightFee = takeAmount(json, "overnightFee");
    record.rampFee = takeAmount(json, "rampFee");
    record.rampFeeWaived = record.rampFee.has_value() && json["rampFeeWaived"].toBool();

    record.averageRating = takeAmount(json, "averageRating");
    if (json["ratingCount"].isDouble()) {
        record.ratingCount = json["ratingCount"].toInt();
    }

    record.lastUpdated = dateFromString(json["lastUpdated"].toString());
    record.updatedBy = json["updatedBy"].toString();
    record.remoteId = json["remoteId"].toString();
    record.isVerified = json["isVerified"].toBool();
    record.pendingUpload = json["pendingUpload"].toBool();

    record.normalizeFuelPair();
    return record;
}

QJsonArray FacilityMapper::toJsonArray(const FacilityList &records)
{
    QJsonArray array;
    for (const FacilityRecord &record : records) {
        array.append(toJson(record));
    }
    return array;
}

FacilityList FacilityMapper::fromJsonArray(const QJsonArray &array)
{
    FacilityList records;
    for (const QJsonValue &val : array) {
        if (val.isObject()) {
            records.append(fromJson(val.toObject()));
        }
    }
    return records;
}

// ========== Bundled CSV dataset ==========

const QStringList &FacilityMapper::csvColumns()
{
    static const QStringList columns = {
        "airport_code", "name", "phone", "unicom", "website",
        "jet_a_price", "avgas_price", "crew_cars", "crew_lounge",
        "catering", "maintenance", "hangars", "deice", "oxygen",
        "gpu", "lav", "handling_fee", "overnight_fee", "ramp_fee", "ramp_fee_waived"
    };
    return columns;
}

QStringList FacilityMapper::splitCsvLine(const QString &line)
{
    QStringList fields;
    QString current;
    bool inQuotes = false;

    for (int i = 0; i < line.length(); ++i) {
        const QChar c = line.at(i);

        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < line.length() && line.at(i + 1) == '"') {
                    current += '"';  // Escaped quote
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            inQuotes = true;
        } else if (c == ',') {
            fields << current;
            current.clear();
        } else {
            current += c;
        }
    }
    fields << current;

    return fields;
}

QList<QStringList> FacilityMapper::readCsv(QIODevice *device)
{
    QList<QStringList> rows;
    if (!device) {
        return rows;
    }

    QTextStream in(device);
    in.setEncoding(QStringConverter::Utf8);
    while (!in.atEnd()) {
        QString line = in.readLine();
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        if (line.trimmed().isEmpty()) {
            continue;
        }
        rows << splitCsvLine(line);
    }

    return rows;
}

bool FacilityMapper::parseFlag(const QString &value)
{
    const QString v = value.trimmed().toLower();
    return v == "1" || v == "yes" || v == "true";
}

std::optional<double> FacilityMapper::parseAmount(const QString &value, bool *ok)
{
    QString text = value.trimmed();
    if (text.startsWith('$')) {
        text = text.mid(1).trimmed();
    }

    if (text.isEmpty()) {
        if (ok) *ok = true;
        return std::nullopt;
    }

    bool parsed = false;
    const double amount = text.toDouble(&parsed);
    if (ok) *ok = parsed;
    if (!parsed) {
        return std::nullopt;
    }
    return amount;
}

FacilityMapper::RowResult FacilityMapper::rowToRecord(const QStringList &row,
                                                      const QDateTime &importedAt)
{
    RowResult result;

    if (row.size() != ColumnCount) {
        result.error = QString("Expected %1 fields, got %2").arg(ColumnCount).arg(row.size());
        return result;
    }

    if (row[ColAirportCode].trimmed().toLower() == csvColumns().first()
        && row[ColName].trimmed().toLower() == csvColumns().at(ColName)) {
        result.status = RowStatus::Header;
        return result;
    }

    FacilityRecord &record = result.record;
    record.locationCode = row[ColAirportCode].trimmed().toUpper();
    record.name = row[ColName].trimmed();

    if (record.locationCode.isEmpty() || record.name.isEmpty()) {
        result.status = RowStatus::MissingIdentity;
        result.error = "Empty location code or name";
        return result;
    }

    if (!FacilityRecord::isValidLocationCode(record.locationCode)) {
        result.error = QString("Invalid location code: %1").arg(record.locationCode);
        return result;
    }

    record.phoneNumber = row[ColPhone].trimmed();
    record.radioFrequency = row[ColUnicom].trimmed();
    record.website = row[ColWebsite].trimmed();

    struct AmountField {
        int column;
        std::optional<double> *target;
    };
    const AmountField amounts[] = {
        { ColJetAPrice, &record.jetAPrice },
        { ColAvgasPrice, &record.avgasPrice },
        { ColHandlingFee, &record.handlingFee },
        { ColOvernightFee, &record.overnightFee },
        { ColRampFee, &record.rampFee },
    };
    for (const AmountField &field : amounts) {
        bool ok = false;
        *field.target = parseAmount(row[field.column], &ok);
        if (!ok) {
            result.error = QString("Non-numeric %1: %2")
                .arg(csvColumns().at(field.column), row[field.column]);
            return result;
        }
    }

    record.hasCrewCars = parseFlag(row[ColCrewCars]);
    record.hasCrewLounge = parseFlag(row[ColCrewLounge]);
    record.hasCatering = parseFlag(row[ColCatering]);
    record.hasMaintenance = parseFlag(row[ColMaintenance]);
    record.hasHangars = parseFlag(row[ColHangars]);
    record.hasDeice = parseFlag(row[ColDeice]);
    record.hasOxygen = parseFlag(row[ColOxygen]);
    record.hasGPU = parseFlag(row[ColGpu]);
    record.hasLav = parseFlag(row[ColLav]);
    record.rampFeeWaived = record.rampFee.has_value() && parseFlag(row[ColRampFeeWaived]);

    record.lastUpdated = importedAt.toUTC();
    record.updatedBy = FacilityRecord::ImportLabel;
    record.isVerified = true;
    if (record.hasFuelPrice()) {
        record.fuelPriceDate = record.lastUpdated;
    }
    record.normalizeFuelPair();

    result.status = RowStatus::Ok;
    return result;
}

} // namespace Fbo
