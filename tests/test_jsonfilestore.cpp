/**
 * @file test_jsonfilestore.cpp
 * @brief Unit tests for JsonFileStore
 *
 * Tests the per-location JSON Local Store.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QFile>
#include <QDir>
#include "sync/jsonfilestore.h"

using namespace Fbo;

namespace {

FacilityRecord makeRecord(const QString &code, const QString &name)
{
    FacilityRecord record;
    record.locationCode = code;
    record.name = name;
    record.lastUpdated = QDateTime(QDate(2024, 1, 1), QTime(0, 0), Qt::UTC);
    record.updatedBy = "pilot1";
    return record;
}

} // namespace

class TestJsonFileStore : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== Construction Tests ==========
    void testStoreId();
    void testCreatesDirectory();
    void testEmptyStore();

    // ========== Collection Tests ==========
    void testSaveAndLoad();
    void testSaveReplacesCollection();
    void testLocationCodeNormalized();
    void testPersistsAcrossInstances();
    void testRemoveCollection();
    void testLocationCodes();
    void testEmptyCodeRejected();

    // ========== File Format ==========
    void testFileName();
    void testCorruptFileIgnored();

    // ========== Signal Tests ==========
    void testCollectionChangedSignal();

private:
    QTemporaryDir *m_tempDir;
    JsonFileStore *m_store;
};

void TestJsonFileStore::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    m_store = new JsonFileStore(m_tempDir->filePath("facilities"));
}

void TestJsonFileStore::cleanup()
{
    delete m_store;
    delete m_tempDir;
    m_store = nullptr;
    m_tempDir = nullptr;
}

// ========== Construction Tests ==========

void TestJsonFileStore::testStoreId()
{
    QCOMPARE(m_store->storeId(), QString("json-file"));
}

void TestJsonFileStore::testCreatesDirectory()
{
    QVERIFY(QDir(m_tempDir->filePath("facilities")).exists());
}

void TestJsonFileStore::testEmptyStore()
{
    QVERIFY(m_store->locationCodes().isEmpty());
    QVERIFY(m_store->loadCollection("KSFO").isEmpty());
    QVERIFY(!m_store->hasCollection("KSFO"));
}

// ========== Collection Tests ==========

void TestJsonFileStore::testSaveAndLoad()
{
    const FacilityList records = { makeRecord("KSFO", "Atlantic"), makeRecord("KSFO", "Signature") };

    QVERIFY(m_store->saveCollection("KSFO", records));
    QCOMPARE(m_store->loadCollection("KSFO"), records);
    QVERIFY(m_store->hasCollection("KSFO"));
}

void TestJsonFileStore::testSaveReplacesCollection()
{
    QVERIFY(m_store->saveCollection("KSFO", { makeRecord("KSFO", "Atlantic") }));
    QVERIFY(m_store->saveCollection("KSFO", { makeRecord("KSFO", "Signature") }));

    const FacilityList records = m_store->loadCollection("KSFO");
    QCOMPARE(records.size(), 1);
    QCOMPARE(records.first().name, QString("Signature"));
}

void TestJsonFileStore::testLocationCodeNormalized()
{
    QVERIFY(m_store->saveCollection(" ksfo ", { makeRecord("KSFO", "Atlantic") }));
    QCOMPARE(m_store->loadCollection("KSFO").size(), 1);
    QCOMPARE(m_store->loadCollection("ksfo").size(), 1);
}

void TestJsonFileStore::testPersistsAcrossInstances()
{
    FacilityRecord record = makeRecord("KSFO", "Signature");
    record.jetAPrice = 6.5;
    record.fuelPriceDate = record.lastUpdated;
    record.pendingUpload = true;
    QVERIFY(m_store->saveCollection("KSFO", { record }));

    JsonFileStore reopened(m_tempDir->filePath("facilities"));
    QCOMPARE(reopened.loadCollection("KSFO"), FacilityList({ record }));
}

void TestJsonFileStore::testRemoveCollection()
{
    QVERIFY(m_store->saveCollection("KSFO", { makeRecord("KSFO", "Atlantic") }));
    QVERIFY(m_store->removeCollection("KSFO"));

    QVERIFY(!m_store->hasCollection("KSFO"));
    QVERIFY(!QFile::exists(QDir(m_store->basePath()).filePath("KSFO.json")));

    // Removing twice is fine
    QVERIFY(m_store->removeCollection("KSFO"));
}

void TestJsonFileStore::testLocationCodes()
{
    QVERIFY(m_store->saveCollection("KSFO", { makeRecord("KSFO", "A") }));
    QVERIFY(m_store->saveCollection("KOAK", { makeRecord("KOAK", "B") }));

    QCOMPARE(m_store->locationCodes(), QStringList({"KOAK", "KSFO"}));
}

void TestJsonFileStore::testEmptyCodeRejected()
{
    QSignalSpy errorSpy(m_store, &LocalStore::errorOccurred);
    QVERIFY(!m_store->saveCollection("  ", { makeRecord("KSFO", "A") }));
    QCOMPARE(errorSpy.count(), 1);
}

// ========== File Format ==========

void TestJsonFileStore::testFileName()
{
    QCOMPARE(JsonFileStore::fileNameFor("ksfo"), QString("KSFO.json"));
    QCOMPARE(JsonFileStore::fileNameFor("../x"), QString("___X.json"));
}

void TestJsonFileStore::testCorruptFileIgnored()
{
    QVERIFY(m_store->saveCollection("KSFO", { makeRecord("KSFO", "A") }));

    QFile corrupt(QDir(m_store->basePath()).filePath("KOAK.json"));
    QVERIFY(corrupt.open(QIODevice::WriteOnly));
    corrupt.write("{ not json");
    corrupt.close();

    QCOMPARE(m_store->reload(), 1);
    QCOMPARE(m_store->locationCodes(), QStringList({"KSFO"}));
}

// ========== Signal Tests ==========

void TestJsonFileStore::testCollectionChangedSignal()
{
    QSignalSpy spy(m_store, &LocalStore::collectionChanged);

    QVERIFY(m_store->saveCollection("KSFO", { makeRecord("KSFO", "A") }));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).toString(), QString("KSFO"));

    QVERIFY(m_store->removeCollection("KSFO"));
    QCOMPARE(spy.count(), 2);
}

QTEST_MAIN(TestJsonFileStore)
#include "test_jsonfilestore.moc"
