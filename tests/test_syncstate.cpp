/**
 * @file test_syncstate.cpp
 * @brief Unit tests for SyncState class
 *
 * Tests dataset versioning, remote snapshot caching, the deletion
 * outbox and persistence.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QSignalSpy>
#include "sync/syncstate.h"

using namespace Fbo;

namespace {

FacilityRecord remoteRecord(const QString &name, const QString &id)
{
    FacilityRecord record;
    record.locationCode = "KSFO";
    record.name = name;
    record.remoteId = id;
    record.updatedBy = "pilot1";
    record.lastUpdated = QDateTime(QDate(2024, 1, 1), QTime(0, 0), Qt::UTC);
    return record;
}

const QDateTime Fetched(QDate(2024, 7, 1), QTime(12, 0), Qt::UTC);

} // namespace

class TestSyncState : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Construction Tests ==========
    void testConstruction();

    // ========== Dataset Version Tests ==========
    void testNeedsImport();
    void testSetDatasetVersion();
    void testVersionNeverGoesBack();
    void testVersionBumpClearsSnapshots();
    void testVersionBumpKeepsOutbox();

    // ========== Snapshot Tests ==========
    void testRemoteSnapshot();
    void testSnapshotHashDetectsChange();
    void testRemoveRemoteSnapshot();
    void testLastSyncTime();

    // ========== Outbox Tests ==========
    void testQueueDeletion();
    void testQueueDeletionDeduplicates();
    void testRemovePendingDeletion();

    // ========== Persistence Tests ==========
    void testSaveAndLoad();
    void testLoadNonExistent();
    void testLoadCorrupt();
    void testClear();

    // ========== Hash Calculation ==========
    void testCalculateHash();

    // ========== Signal Tests ==========
    void testStateChangedSignal();

private:
    QTemporaryDir *m_tempDir;
    SyncState *m_state;
};

void TestSyncState::initTestCase()
{
    qDebug() << "Starting SyncState tests";
}

void TestSyncState::cleanupTestCase()
{
    qDebug() << "SyncState tests complete";
}

void TestSyncState::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    m_state = new SyncState(m_tempDir->filePath(".state"));
}

void TestSyncState::cleanup()
{
    delete m_state;
    delete m_tempDir;
    m_state = nullptr;
    m_tempDir = nullptr;
}

// ========== Construction Tests ==========

void TestSyncState::testConstruction()
{
    QCOMPARE(m_state->datasetVersion(), 0);
    QCOMPARE(m_state->statePath(), m_tempDir->filePath(".state"));
    QVERIFY(m_state->stateFilePath().endsWith("state.json"));
    QVERIFY(m_state->knownLocations().isEmpty());
}

// ========== Dataset Version Tests ==========

void TestSyncState::testNeedsImport()
{
    QVERIFY(m_state->needsImport(1));
    QVERIFY(!m_state->needsImport(0));
}

void TestSyncState::testSetDatasetVersion()
{
    QVERIFY(m_state->setDatasetVersion(3));
    QCOMPARE(m_state->datasetVersion(), 3);
    QVERIFY(!m_state->needsImport(3));
    QVERIFY(m_state->needsImport(4));
}

void TestSyncState::testVersionNeverGoesBack()
{
    QVERIFY(m_state->setDatasetVersion(3));
    QVERIFY(!m_state->setDatasetVersion(2));
    QVERIFY(!m_state->setDatasetVersion(3));
    QCOMPARE(m_state->datasetVersion(), 3);
}

void TestSyncState::testVersionBumpClearsSnapshots()
{
    m_state->setRemoteSnapshot("KSFO", { remoteRecord("Signature", "r1") }, Fetched);
    m_state->setLastSyncTime("KSFO", Fetched);

    QVERIFY(m_state->setDatasetVersion(2));

    QVERIFY(!m_state->hasRemoteSnapshot("KSFO"));
    QVERIFY(m_state->remoteSnapshot("KSFO").records.isEmpty());
    QCOMPARE(m_state->lastSyncTime("KSFO"), Fetched);
}

void TestSyncState::testVersionBumpKeepsOutbox()
{
    m_state->queueDeletion({ "KSFO", "r1", Fetched });
    QVERIFY(m_state->setDatasetVersion(2));
    QCOMPARE(m_state->pendingDeletionCount(), 1);
}

// ========== Snapshot Tests ==========

void TestSyncState::testRemoteSnapshot()
{
    const FacilityList records = { remoteRecord("Signature", "r1"), remoteRecord("Atlantic", "r2") };
    m_state->setRemoteSnapshot("KSFO", records, Fetched);

    const RemoteSnapshot snapshot = m_state->remoteSnapshot("KSFO");
    QVERIFY(snapshot.isValid());
    QCOMPARE(snapshot.fetchedAt, Fetched);
    QCOMPARE(snapshot.records, records);
    QCOMPARE(snapshot.contentHash.length(), 16);
    QVERIFY(!m_state->hasRemoteSnapshot("KOAK"));
}

void TestSyncState::testSnapshotHashDetectsChange()
{
    const FacilityList records = { remoteRecord("Signature", "r1") };

    QVERIFY(m_state->setRemoteSnapshot("KSFO", records, Fetched));
    QVERIFY(!m_state->setRemoteSnapshot("KSFO", records, Fetched.addSecs(60)));

    FacilityList changed = records;
    changed[0].phoneNumber = "555";
    QVERIFY(m_state->setRemoteSnapshot("KSFO", changed, Fetched.addSecs(120)));
}

void TestSyncState::testRemoveRemoteSnapshot()
{
    m_state->setRemoteSnapshot("KSFO", { remoteRecord("Signature", "r1") }, Fetched);
    m_state->removeRemoteSnapshot("KSFO");
    QVERIFY(!m_state->hasRemoteSnapshot("KSFO"));
}

void TestSyncState::testLastSyncTime()
{
    QVERIFY(!m_state->lastSyncTime("KSFO").isValid());
    m_state->setLastSyncTime("KSFO", Fetched);
    QCOMPARE(m_state->lastSyncTime("KSFO"), Fetched);
    QCOMPARE(m_state->knownLocations(), QStringList({"KSFO"}));
}

// ========== Outbox Tests ==========

void TestSyncState::testQueueDeletion()
{
    m_state->queueDeletion({ "KSFO", "r1", Fetched });
    m_state->queueDeletion({ "KOAK", "r2", Fetched });

    QCOMPARE(m_state->pendingDeletionCount(), 2);
    QCOMPARE(m_state->pendingDeletions("KSFO").size(), 1);
    QCOMPARE(m_state->pendingDeletions("KSFO").first().remoteId, QString("r1"));
    QCOMPARE(m_state->locationsWithPendingDeletions(), QStringList({"KSFO", "KOAK"}));
}

void TestSyncState::testQueueDeletionDeduplicates()
{
    m_state->queueDeletion({ "KSFO", "r1", Fetched });
    m_state->queueDeletion({ "KSFO", "r1", Fetched.addSecs(5) });
    QCOMPARE(m_state->pendingDeletionCount(), 1);
}

void TestSyncState::testRemovePendingDeletion()
{
    m_state->queueDeletion({ "KSFO", "r1", Fetched });
    m_state->queueDeletion({ "KSFO", "r2", Fetched });

    m_state->removePendingDeletion("KSFO", "r1");
    QCOMPARE(m_state->pendingDeletions("KSFO").size(), 1);
    QCOMPARE(m_state->pendingDeletions("KSFO").first().remoteId, QString("r2"));
}

// ========== Persistence Tests ==========

void TestSyncState::testSaveAndLoad()
{
    m_state->setDatasetVersion(4);
    m_state->setLastSyncTime("KSFO", Fetched);
    m_state->setRemoteSnapshot("KSFO", { remoteRecord("Signature", "r1") }, Fetched);
    m_state->queueDeletion({ "KOAK", "r9", Fetched });
    QVERIFY(m_state->save());

    SyncState loaded(m_tempDir->filePath(".state"));
    QVERIFY(loaded.load());
    QCOMPARE(loaded.datasetVersion(), 4);
    QCOMPARE(loaded.lastSyncTime("KSFO"), Fetched);
    QCOMPARE(loaded.remoteSnapshot("KSFO").records.size(), 1);
    QCOMPARE(loaded.remoteSnapshot("KSFO").contentHash, m_state->remoteSnapshot("KSFO").contentHash);
    QCOMPARE(loaded.pendingDeletions("KOAK").size(), 1);
}

void TestSyncState::testLoadNonExistent()
{
    QVERIFY(m_state->load());
    QCOMPARE(m_state->datasetVersion(), 0);
}

void TestSyncState::testLoadCorrupt()
{
    QVERIFY(QDir().mkpath(m_state->statePath()));
    QFile file(m_state->stateFilePath());
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ broken");
    file.close();

    QSignalSpy errorSpy(m_state, &SyncState::errorOccurred);
    QVERIFY(!m_state->load());
    QCOMPARE(errorSpy.count(), 1);
}

void TestSyncState::testClear()
{
    m_state->setDatasetVersion(2);
    m_state->queueDeletion({ "KSFO", "r1", Fetched });
    m_state->clear();

    QCOMPARE(m_state->datasetVersion(), 0);
    QCOMPARE(m_state->pendingDeletionCount(), 0);
}

// ========== Hash Calculation ==========

void TestSyncState::testCalculateHash()
{
    QCOMPARE(SyncState::calculateHash("abc"), SyncState::calculateHash("abc"));
    QVERIFY(SyncState::calculateHash("abc") != SyncState::calculateHash("abd"));
    QCOMPARE(SyncState::calculateHash("abc").length(), 16);
}

// ========== Signal Tests ==========

void TestSyncState::testStateChangedSignal()
{
    QSignalSpy spy(m_state, &SyncState::stateChanged);

    m_state->setDatasetVersion(1);
    m_state->setLastSyncTime("KSFO", Fetched);
    m_state->queueDeletion({ "KSFO", "r1", Fetched });

    QCOMPARE(spy.count(), 3);

    // No-op changes stay silent
    m_state->setDatasetVersion(1);
    m_state->removePendingDeletion("KSFO", "unknown");
    QCOMPARE(spy.count(), 3);
}

QTEST_MAIN(TestSyncState)
#include "test_syncstate.moc"
