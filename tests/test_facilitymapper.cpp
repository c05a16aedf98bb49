/**
 * @file test_facilitymapper.cpp
 * @brief Unit tests for FacilityMapper
 *
 * Tests JSON conversion and parsing of the bundled CSV dataset.
 */

#include <QtTest/QtTest>
#include <QBuffer>
#include <QJsonDocument>
#include "mappers/facilitymapper.h"

using namespace Fbo;

namespace {

QStringList datasetRow(const QString &code, const QString &name)
{
    QStringList row;
    row << code << name << "650-555-0100" << "122.95" << "https://fbo.example"
        << "$6.50" << "" << "yes" << "1" << "no" << "TRUE" << "0" << "" << "" << "y" << "true"
        << "25" << "" << "30" << "yes";
    return row;
}

const QDateTime Imported(QDate(2024, 2, 1), QTime(0, 0), Qt::UTC);

} // namespace

class TestFacilityMapper : public QObject
{
    Q_OBJECT

private slots:
    // ========== JSON Tests ==========
    void testJsonFullRecord();
    void testJsonOmitsNullFields();
    void testJsonTimestampsAreUtc();
    void testJsonPriceWithoutDateDropped();
    void testJsonArray();

    // ========== CSV Splitting ==========
    void testSplitSimple();
    void testSplitQuoted();
    void testSplitEscapedQuote();
    void testSplitEmptyFields();
    void testReadCsv();

    // ========== Dataset Rows ==========
    void testRowToRecord();
    void testRowHeader();
    void testRowMissingIdentity();
    void testRowWrongFieldCount();
    void testRowBadPrice();
    void testRowBadLocationCode();
    void testParseFlag_data();
    void testParseFlag();
    void testParseAmount();
};

// ========== JSON Tests ==========

void TestFacilityMapper::testJsonFullRecord()
{
    FacilityRecord record;
    record.locationCode = "KSFO";
    record.name = "Signature Aviation";
    record.phoneNumber = "650-555-0100";
    record.radioFrequency = "122.95";
    record.website = "https://signature.example";
    record.jetAPrice = 6.5;
    record.avgasPrice = 7.1;
    record.fuelPriceDate = Imported;
    record.fuelPriceReporter = "pilot1";
    record.hasCrewCars = true;
    record.hasGPU = true;
    record.handlingFee = 50;
    record.overnightFee = 20;
    record.rampFee = 30;
    record.rampFeeWaived = true;
    record.averageRating = 4.5;
    record.ratingCount = 12;
    record.lastUpdated = Imported;
    record.updatedBy = "pilot1";
    record.remoteId = "abc";
    record.isVerified = true;
    record.pendingUpload = true;

    const QJsonObject json = FacilityMapper::toJson(record);
    QCOMPARE(FacilityMapper::fromJson(json), record);

    // Survives serialization to text
    const QJsonDocument doc = QJsonDocument::fromJson(QJsonDocument(json).toJson());
    QCOMPARE(FacilityMapper::fromJson(doc.object()), record);
}

void TestFacilityMapper::testJsonOmitsNullFields()
{
    FacilityRecord record;
    record.locationCode = "KOAK";
    record.name = "Kaiser Air";

    const QJsonObject json = FacilityMapper::toJson(record);
    QVERIFY(!json.contains("phoneNumber"));
    QVERIFY(!json.contains("jetAPrice"));
    QVERIFY(!json.contains("fuelPriceDate"));
    QVERIFY(!json.contains("rampFee"));
    QVERIFY(!json.contains("rampFeeWaived"));
    QVERIFY(!json.contains("remoteId"));
    QVERIFY(!json.contains("pendingUpload"));

    const FacilityRecord back = FacilityMapper::fromJson(json);
    QVERIFY(!back.jetAPrice.has_value());
    QVERIFY(!back.ratingCount.has_value());
    QVERIFY(back.phoneNumber.isEmpty());
}

void TestFacilityMapper::testJsonTimestampsAreUtc()
{
    FacilityRecord record;
    record.locationCode = "KSFO";
    record.name = "Signature";
    record.lastUpdated = QDateTime(QDate(2024, 2, 1), QTime(10, 0), QTimeZone(3600));

    const QString text = FacilityMapper::toJson(record)["lastUpdated"].toString();
    QVERIFY(text.endsWith('Z'));
    QVERIFY(text.startsWith("2024-02-01T09:00:00"));
}

void TestFacilityMapper::testJsonPriceWithoutDateDropped()
{
    QJsonObject json;
    json["locationCode"] = "KSFO";
    json["name"] = "Signature";
    json["jetAPrice"] = 6.5;

    const FacilityRecord record = FacilityMapper::fromJson(json);
    QVERIFY(!record.hasFuelPrice());
}

void TestFacilityMapper::testJsonArray()
{
    FacilityRecord a;
    a.locationCode = "KSFO";
    a.name = "A";
    FacilityRecord b = a;
    b.name = "B";

    QJsonArray array = FacilityMapper::toJsonArray({a, b});
    array.append(QString("not an object"));

    const FacilityList records = FacilityMapper::fromJsonArray(array);
    QCOMPARE(records.size(), 2);
    QCOMPARE(records.at(1).name, QString("B"));
}

// ========== CSV Splitting ==========

void TestFacilityMapper::testSplitSimple()
{
    QCOMPARE(FacilityMapper::splitCsvLine("a,b,c"), QStringList({"a", "b", "c"}));
}

void TestFacilityMapper::testSplitQuoted()
{
    QCOMPARE(FacilityMapper::splitCsvLine("KSFO,\"Signature, West\",x"),
             QStringList({"KSFO", "Signature, West", "x"}));
}

void TestFacilityMapper::testSplitEscapedQuote()
{
    QCOMPARE(FacilityMapper::splitCsvLine("\"The \"\"Best\"\" FBO\",1"),
             QStringList({"The \"Best\" FBO", "1"}));
}

void TestFacilityMapper::testSplitEmptyFields()
{
    QCOMPARE(FacilityMapper::splitCsvLine(",,"), QStringList({"", "", ""}));
}

void TestFacilityMapper::testReadCsv()
{
    QByteArray data = "a,b\r\n\r\nc,d\n";
    QBuffer buffer(&data);
    QVERIFY(buffer.open(QIODevice::ReadOnly));

    const QList<QStringList> rows = FacilityMapper::readCsv(&buffer);
    QCOMPARE(rows.size(), 2);
    QCOMPARE(rows.at(0), QStringList({"a", "b"}));
    QCOMPARE(rows.at(1), QStringList({"c", "d"}));
}

// ========== Dataset Rows ==========

void TestFacilityMapper::testRowToRecord()
{
    const FacilityMapper::RowResult result =
        FacilityMapper::rowToRecord(datasetRow(" ksfo ", " Signature Aviation "), Imported);

    QCOMPARE(result.status, FacilityMapper::RowStatus::Ok);
    const FacilityRecord &record = result.record;
    QCOMPARE(record.locationCode, QString("KSFO"));
    QCOMPARE(record.name, QString("Signature Aviation"));
    QCOMPARE(record.phoneNumber, QString("650-555-0100"));
    QCOMPARE(record.radioFrequency, QString("122.95"));
    QCOMPARE(record.jetAPrice, std::optional<double>(6.50));
    QVERIFY(!record.avgasPrice.has_value());
    QCOMPARE(record.fuelPriceDate, Imported);
    QVERIFY(record.hasCrewCars);
    QVERIFY(record.hasCrewLounge);
    QVERIFY(!record.hasCatering);
    QVERIFY(record.hasMaintenance);
    QVERIFY(!record.hasHangars);
    QVERIFY(!record.hasGPU);         // "y" is not a true token
    QVERIFY(record.hasLav);
    QCOMPARE(record.handlingFee, std::optional<double>(25));
    QVERIFY(!record.overnightFee.has_value());
    QCOMPARE(record.rampFee, std::optional<double>(30));
    QVERIFY(record.rampFeeWaived);
    QVERIFY(record.isVerified);
    QCOMPARE(record.updatedBy, FacilityRecord::ImportLabel);
    QCOMPARE(record.lastUpdated, Imported);
    QVERIFY(record.remoteId.isEmpty());
}

void TestFacilityMapper::testRowHeader()
{
    const FacilityMapper::RowResult result =
        FacilityMapper::rowToRecord(FacilityMapper::csvColumns(), Imported);
    QCOMPARE(result.status, FacilityMapper::RowStatus::Header);
}

void TestFacilityMapper::testRowMissingIdentity()
{
    QCOMPARE(FacilityMapper::rowToRecord(datasetRow("", "Signature"), Imported).status,
             FacilityMapper::RowStatus::MissingIdentity);
    QCOMPARE(FacilityMapper::rowToRecord(datasetRow("KSFO", "  "), Imported).status,
             FacilityMapper::RowStatus::MissingIdentity);
}

void TestFacilityMapper::testRowWrongFieldCount()
{
    QStringList row = datasetRow("KSFO", "Signature");
    row.removeLast();

    const FacilityMapper::RowResult result = FacilityMapper::rowToRecord(row, Imported);
    QCOMPARE(result.status, FacilityMapper::RowStatus::Malformed);
    QVERIFY(!result.error.isEmpty());
}

void TestFacilityMapper::testRowBadPrice()
{
    QStringList row = datasetRow("KSFO", "Signature");
    row[5] = "call";

    QCOMPARE(FacilityMapper::rowToRecord(row, Imported).status,
             FacilityMapper::RowStatus::Malformed);
}

void TestFacilityMapper::testRowBadLocationCode()
{
    QCOMPARE(FacilityMapper::rowToRecord(datasetRow("KSFOX", "Signature"), Imported).status,
             FacilityMapper::RowStatus::Malformed);
    QCOMPARE(FacilityMapper::rowToRecord(datasetRow("SF", "Signature"), Imported).status,
             FacilityMapper::RowStatus::Malformed);
    QCOMPARE(FacilityMapper::rowToRecord(datasetRow("O88", "Byron"), Imported).status,
             FacilityMapper::RowStatus::Ok);

    // Letters and digits only, as the edit path requires
    const FacilityMapper::RowResult dotted =
        FacilityMapper::rowToRecord(datasetRow("K.SF", "Signature"), Imported);
    QCOMPARE(dotted.status, FacilityMapper::RowStatus::Malformed);
    QVERIFY(dotted.error.contains("K.SF"));
    QCOMPARE(FacilityMapper::rowToRecord(datasetRow("K_SF", "Signature"), Imported).status,
             FacilityMapper::RowStatus::Malformed);
    QCOMPARE(FacilityMapper::rowToRecord(datasetRow("K SF", "Signature"), Imported).status,
             FacilityMapper::RowStatus::Malformed);
}

void TestFacilityMapper::testParseFlag_data()
{
    QTest::addColumn<QString>("value");
    QTest::addColumn<bool>("expected");

    QTest::newRow("1") << "1" << true;
    QTest::newRow("yes") << "yes" << true;
    QTest::newRow("YES") << "YES" << true;
    QTest::newRow("true") << "true" << true;
    QTest::newRow("True padded") << " True " << true;
    QTest::newRow("0") << "0" << false;
    QTest::newRow("no") << "no" << false;
    QTest::newRow("y") << "y" << false;
    QTest::newRow("empty") << "" << false;
    QTest::newRow("2") << "2" << false;
}

void TestFacilityMapper::testParseFlag()
{
    QFETCH(QString, value);
    QFETCH(bool, expected);
    QCOMPARE(FacilityMapper::parseFlag(value), expected);
}

void TestFacilityMapper::testParseAmount()
{
    bool ok = false;
    QCOMPARE(FacilityMapper::parseAmount("$ 6.25", &ok), std::optional<double>(6.25));
    QVERIFY(ok);

    QVERIFY(!FacilityMapper::parseAmount("", &ok).has_value());
    QVERIFY(ok);

    QVERIFY(!FacilityMapper::parseAmount("n/a", &ok).has_value());
    QVERIFY(!ok);
}

QTEST_MAIN(TestFacilityMapper)
#include "test_facilitymapper.moc"
