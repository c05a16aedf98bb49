/**
 * @file test_baselineimporter.cpp
 * @brief Unit tests for BaselineImporter
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QFile>
#include "sync/baselineimporter.h"
#include "mappers/facilitymapper.h"

using namespace Fbo;

namespace {

QStringList row(const QString &code, const QString &name, const QString &jetA = QString())
{
    QStringList fields;
    fields << code << name << "" << "" << "" << jetA << "";
    for (int i = 0; i < 9; ++i) {
        fields << "0";
    }
    fields << "" << "" << "" << "";
    return fields;
}

const QDateTime Imported(QDate(2024, 6, 1), QTime(0, 0), Qt::UTC);

} // namespace

class TestBaselineImporter : public QObject
{
    Q_OBJECT

private slots:
    void testParseRows();
    void testHeaderNotCounted();
    void testSkippedAndMalformedCounted();
    void testPunctuatedCodesAreMalformed();
    void testAlwaysCompletes();
    void testParseFile();
    void testParseMissingFile();
    void testGroupByLocation();
};

void TestBaselineImporter::testParseRows()
{
    const BaselineImporter::ParseResult result = BaselineImporter::parseRows(
        { row("KSFO", "Signature", "6.50"), row("KOAK", "Kaiser Air") }, Imported);

    QCOMPARE(result.records.size(), 2);
    QCOMPARE(result.skipped, 0);
    for (const FacilityRecord &record : result.records) {
        QVERIFY(record.isVerified);
        QVERIFY(record.isImported());
        QCOMPARE(record.lastUpdated, Imported);
    }
    QCOMPARE(result.records.first().jetAPrice, std::optional<double>(6.50));
    QCOMPARE(result.records.first().fuelPriceDate, Imported);
    QVERIFY(!result.records.last().fuelPriceDate.isValid());
}

void TestBaselineImporter::testHeaderNotCounted()
{
    const BaselineImporter::ParseResult result = BaselineImporter::parseRows(
        { FacilityMapper::csvColumns(), row("KSFO", "Signature") }, Imported);

    QCOMPARE(result.records.size(), 1);
    QCOMPARE(result.skipped, 0);
}

void TestBaselineImporter::testSkippedAndMalformedCounted()
{
    QStringList shortRow = row("KSFO", "Short");
    shortRow.removeLast();

    const BaselineImporter::ParseResult result = BaselineImporter::parseRows(
        { row("", "No Code"), row("KSFO", ""), shortRow, row("KSFO", "Bad Price", "abc"),
          row("KSFO", "Good") }, Imported);

    QCOMPARE(result.records.size(), 1);
    QCOMPARE(result.skipped, 4);
    QCOMPARE(result.malformed, 2);
    QCOMPARE(result.errors.size(), 2);
    QVERIFY(result.errors.first().startsWith("line 3:"));
}

void TestBaselineImporter::testPunctuatedCodesAreMalformed()
{
    const BaselineImporter::ParseResult result = BaselineImporter::parseRows(
        { row("K.SF", "Dotted"), row("K_SF", "Underscored"), row("KSFO", "Signature") }, Imported);

    QCOMPARE(result.records.size(), 1);
    QCOMPARE(result.records.first().locationCode, QString("KSFO"));
    QCOMPARE(result.skipped, 2);
    QCOMPARE(result.malformed, 2);
    QCOMPARE(BaselineImporter::groupByLocation(result.records).keys(), QStringList({"KSFO"}));
}

void TestBaselineImporter::testAlwaysCompletes()
{
    QList<QStringList> rows;
    for (int i = 0; i < 50; ++i) {
        rows << QStringList({"garbage"});
    }
    rows << row("KSFO", "Signature");

    const BaselineImporter::ParseResult result = BaselineImporter::parseRows(rows, Imported);
    QCOMPARE(result.records.size(), 1);
    QCOMPARE(result.malformed, 50);
}

void TestBaselineImporter::testParseFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const QString path = dir.filePath("fbos.csv");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Text));
    file.write(FacilityMapper::csvColumns().join(',').toUtf8() + "\n");
    file.write("KSFO,\"Signature Aviation, West\",,,,$6.50,,1,1,0,0,0,0,0,0,0,,,,\n");
    file.write("KOAK,Kaiser Air,,,,,,yes,,,,,,,,,,,,\n");
    file.close();

    BaselineImporter::ParseResult result;
    QString error;
    QVERIFY(BaselineImporter::parseFile(path, Imported, &result, &error));
    QCOMPARE(result.records.size(), 2);
    QCOMPARE(result.records.first().name, QString("Signature Aviation, West"));
    QVERIFY(result.records.last().hasCrewCars);
}

void TestBaselineImporter::testParseMissingFile()
{
    BaselineImporter::ParseResult result;
    QString error;
    QVERIFY(!BaselineImporter::parseFile("/nonexistent/fbos.csv", Imported, &result, &error));
    QVERIFY(!error.isEmpty());
}

void TestBaselineImporter::testGroupByLocation()
{
    const BaselineImporter::ParseResult parsed = BaselineImporter::parseRows(
        { row("KSFO", "Signature"), row("KOAK", "Kaiser Air"), row("KSFO", "Atlantic") }, Imported);

    const QMap<QString, FacilityList> groups = BaselineImporter::groupByLocation(parsed.records);
    QCOMPARE(groups.keys(), QStringList({"KOAK", "KSFO"}));
    QCOMPARE(groups.value("KSFO").size(), 2);
}

QTEST_MAIN(TestBaselineImporter)
#include "test_baselineimporter.moc"
