#ifndef BASELINEIMPORTER_H
#define BASELINEIMPORTER_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QMap>
#include "../model/facilityrecord.h"

namespace Fbo {

/**
 * @brief Parses the bundled facility dataset into verified records
 *
 * Only parsing happens here. Folding the records into the Local Store
 * (per location, through the Reconciler, once per dataset version) is
 * SyncEngine::importBaseline().
 */
class BaselineImporter
{
public:
    struct ParseResult {
        FacilityList records;
        int skipped = 0;        ///< All rows not turned into records (header excluded)
        int malformed = 0;      ///< Subset of skipped: wrong shape or bad number
        QStringList errors;     ///< "line N: reason" for malformed rows
    };

    /**
     * @brief Turn dataset rows into records
     * @param rows Split CSV rows, optionally starting with the header
     * @param importedAt Timestamp stamped on every record
     */
    static ParseResult parseRows(const QList<QStringList> &rows, const QDateTime &importedAt);

    /**
     * @brief Read and parse a dataset file
     * @param error Set when the file cannot be opened
     * @return false if the file cannot be read at all
     */
    static bool parseFile(const QString &filePath, const QDateTime &importedAt,
                          ParseResult *result, QString *error);

    /**
     * @brief Split records by location code, codes in ascending order
     */
    static QMap<QString, FacilityList> groupByLocation(const FacilityList &records);
};

} // namespace Fbo

#endif // BASELINEIMPORTER_H
