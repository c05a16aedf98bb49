#ifndef FACILITYMAPPER_H
#define FACILITYMAPPER_H

#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QJsonArray>
#include <QObject>
#include "../model/facilityrecord.h"

class QIODevice;

namespace Fbo {

/**
 * @brief Converts facility records to and from their external forms
 *
 * Two formats:
 *   - JSON objects, used by the local store, the sync state cache and
 *     the file-backed remote store. Null fields are omitted, timestamps
 *     are ISO-8601 UTC.
 *   - Rows of the bundled CSV dataset (20 columns, see csvColumns()).
 */
class FacilityMapper : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Outcome of parsing one CSV row
     */
    enum class RowStatus {
        Ok,             ///< record is filled in
        Header,         ///< the dataset's column header row
        MissingIdentity,///< empty location code or name
        Malformed       ///< wrong field count, bad number or bad location code
    };

    struct RowResult {
        RowStatus status = RowStatus::Malformed;
        FacilityRecord record;
        QString error;
    };

    explicit FacilityMapper(QObject *parent = nullptr);
    ~FacilityMapper();

    // ========== JSON ==========

    static QJsonObject toJson(const FacilityRecord &record);
    static FacilityRecord fromJson(const QJsonObject &json);

    static QJsonArray toJsonArray(const FacilityList &records);
    static FacilityList fromJsonArray(const QJsonArray &array);

    // ========== Bundled CSV dataset ==========

    /**
     * @brief Column names of the bundled dataset, in order
     */
    static const QStringList &csvColumns();

    /**
     * @brief Split one CSV line, honouring double-quoted fields
     */
    static QStringList splitCsvLine(const QString &line);

    /**
     * @brief Read every non-empty line of a CSV document into rows
     */
    static QList<QStringList> readCsv(QIODevice *device);

    /**
     * @brief Turn a dataset row into a verified, import-labelled record
     * @param row Fields in csvColumns() order
     * @param importedAt Timestamp used for lastUpdated and fuelPriceDate
     */
    static RowResult rowToRecord(const QStringList &row, const QDateTime &importedAt);

    /**
     * @brief Dataset boolean: "1", "yes", "true" (any case) are true
     */
    static bool parseFlag(const QString &value);

    /**
     * @brief Optional amount; empty means null, a leading '$' is allowed
     * @param ok Set to false when the text is not a number
     */
    static std::optional<double> parseAmount(const QString &value, bool *ok);

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);
};

} // namespace Fbo

#endif // FACILITYMAPPER_H
