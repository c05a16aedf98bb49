#include "baselineimporter.h"
#include "../mappers/facilitymapper.h"

#include <QFile>
#include <QDebug>

namespace Fbo {

BaselineImporter::ParseResult BaselineImporter::parseRows(const QList<QStringList> &rows,
                                                          const QDateTime &importedAt)
{
    ParseResult result;

    for (int i = 0; i < rows.size(); ++i) {
        const FacilityMapper::RowResult row = FacilityMapper::rowToRecord(rows.at(i), importedAt);

        switch (row.status) {
        case FacilityMapper::RowStatus::Ok:
            result.records.append(row.record);
            break;
        case FacilityMapper::RowStatus::Header:
            break;
        case FacilityMapper::RowStatus::MissingIdentity:
            result.skipped++;
            break;
        case FacilityMapper::RowStatus::Malformed:
            result.skipped++;
            result.malformed++;
            result.errors << QString("line %1: %2").arg(i + 1).arg(row.error);
            break;
        }
    }

    qDebug() << "[BaselineImporter] Parsed" << result.records.size() << "records,"
             << result.skipped << "skipped," << result.malformed << "malformed";
    return result;
}

bool BaselineImporter::parseFile(const QString &filePath, const QDateTime &importedAt,
                                 ParseResult *result, QString *error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (error) {
            *error = QString("Failed to open dataset %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }

    *result = parseRows(FacilityMapper::readCsv(&file), importedAt);
    return true;
}

QMap<QString, FacilityList> BaselineImporter::groupByLocation(const FacilityList &records)
{
    QMap<QString, FacilityList> byLocation;
    for (const FacilityRecord &record : records) {
        byLocation[record.locationCode].append(record);
    }
    return byLocation;
}

} // namespace Fbo
