/**
 * @file test_localstore.cpp
 * @brief Unit tests for MemoryStore and JsonFileStore
 *
 * Tests record operations, the outbox, marker stamping and the
 * on-disk format of the durable store.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QFile>
#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>
#include "store/memorystore.h"
#include "store/jsonfilestore.h"
#include "model/recordkinds.h"

using namespace LedgerSync;

class TestLocalStore : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== Record Operations ==========
    void testSaveAndFetch();
    void testFetchWithPredicate();
    void testSaveRejectsUnknownKind();
    void testSaveRejectsInvalidRecord();
    void testRemoveLeavesTombstone();
    void testRemoveMissing();
    void testRecordChangedSignal();

    // ========== Marker Tests ==========
    void testZeroMarkerStamped();
    void testExplicitMarkerKept();
    void testMarkerNeverGoesBackwards();

    // ========== Outbox Tests ==========
    void testSaveQueuesChange();
    void testMarkPushedClearsEntry();
    void testMarkPushedKeepsNewerChange();
    void testApplyRemoteBypassesOutbox();
    void testApplyRemoteClearsPending();

    // ========== Conditional Write Tests ==========
    void testSnapshot();
    void testConditionalApplyWhenUnchanged();
    void testConditionalApplyKeepsInterleavedSave();
    void testConditionalApplyKeepsNewRecord();
    void testConditionalSaveKeepsInterleavedSave();

    // ========== Summary Tests ==========
    void testSummary();

    // ========== JsonFileStore Tests ==========
    void testJsonCreatesFile();
    void testJsonReopenKeepsState();
    void testJsonCorruptFile();
    void testJsonSchemaMismatch();
    void testJsonBindingMismatch();
    void testJsonReplicatingWithoutContainer();
    void testJsonLocalOpenIgnoresBinding();
    void testJsonDestroy();

private:
    QString storeDir() const { return QDir(m_tempDir->path()).filePath("store"); }

    QTemporaryDir *m_tempDir = nullptr;
    MemoryStore *m_store = nullptr;
};

void TestLocalStore::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
    m_store = new MemoryStore(StoreSchema::full());
}

void TestLocalStore::cleanup()
{
    delete m_store;
    delete m_tempDir;
    m_store = nullptr;
    m_tempDir = nullptr;
}

// ========== Record Operations ==========

void TestLocalStore::testSaveAndFetch()
{
    QVERIFY(m_store->save(Records::makeCategory("c1", "Food", "cart")));
    QVERIFY(m_store->save(Records::makeCategory("c2", "Bills", "doc")));
    QVERIFY(m_store->save(Records::makeExpense("e1", 10, QDateTime::currentDateTimeUtc())));

    QCOMPARE(m_store->fetch(Records::Category).size(), 2);
    QCOMPARE(m_store->fetch(Records::Expense).size(), 1);
    QVERIFY(m_store->contains(Records::Category, "c1"));
    QCOMPARE(m_store->record(Records::Category, "c2").field("name").toString(), QString("Bills"));
    QVERIFY(!m_store->record(Records::Category, "missing").isValid());
}

void TestLocalStore::testFetchWithPredicate()
{
    QDateTime now = QDateTime::currentDateTimeUtc();
    m_store->save(Records::makeExpense("e1", 5, now));
    m_store->save(Records::makeExpense("e2", 50, now));
    m_store->save(Records::makeExpense("e3", 500, now));

    QList<SyncRecord> large = m_store->fetch(Records::Expense, [](const SyncRecord &r) {
        return r.field("amount").toDouble() > 20;
    });
    QCOMPARE(large.size(), 2);
}

void TestLocalStore::testSaveRejectsUnknownKind()
{
    MemoryStore minimal(StoreSchema::minimal());
    QSignalSpy spy(&minimal, &LocalStore::errorOccurred);

    SyncRecord budget(Records::SharedBudget, "b1");
    QVERIFY(!minimal.save(budget));
    QCOMPARE(spy.count(), 1);
    QVERIFY(minimal.errorString().contains("SharedBudget"));
    QCOMPARE(minimal.pendingChangeCount(), 0);
}

void TestLocalStore::testSaveRejectsInvalidRecord()
{
    QVERIFY(!m_store->save(SyncRecord()));
    QVERIFY(!m_store->applyRemote(SyncRecord(Records::Expense, QString())));
}

void TestLocalStore::testRemoveLeavesTombstone()
{
    m_store->save(Records::makeCategory("c1", "Food", "cart"));
    QVERIFY(m_store->remove(Records::Category, "c1"));

    QVERIFY(!m_store->contains(Records::Category, "c1"));
    QVERIFY(m_store->fetch(Records::Category).isEmpty());

    SyncRecord tombstone = m_store->record(Records::Category, "c1");
    QVERIFY(tombstone.isValid());
    QVERIFY(tombstone.isDeleted);
    QVERIFY(tombstone.fields.isEmpty());
    QVERIFY(m_store->isPending(Records::Category, "c1"));
}

void TestLocalStore::testRemoveMissing()
{
    QVERIFY(!m_store->remove(Records::Category, "nope"));

    m_store->save(Records::makeCategory("c1", "Food", "cart"));
    QVERIFY(m_store->remove(Records::Category, "c1"));
    QVERIFY(!m_store->remove(Records::Category, "c1"));
}

void TestLocalStore::testRecordChangedSignal()
{
    QSignalSpy spy(m_store, &LocalStore::recordChanged);

    m_store->save(Records::makeCategory("c1", "Food", "cart"));
    SyncRecord remote = Records::makeCategory("c2", "Bills", "doc");
    remote.modifiedMarker = 100;
    m_store->applyRemote(remote);

    QCOMPARE(spy.count(), 2);
    QCOMPARE(spy.at(0).at(0).toString(), Records::Category);
    QCOMPARE(spy.at(1).at(1).toString(), QString("c2"));
}

// ========== Marker Tests ==========

void TestLocalStore::testZeroMarkerStamped()
{
    qint64 before = QDateTime::currentMSecsSinceEpoch();
    m_store->save(Records::makeCategory("c1", "Food", "cart"));
    QVERIFY(m_store->record(Records::Category, "c1").modifiedMarker >= before);
}

void TestLocalStore::testExplicitMarkerKept()
{
    SyncRecord category = Records::makeCategory("c1", "Food", "cart");
    category.modifiedMarker = 1000;
    m_store->save(category);
    QCOMPARE(m_store->record(Records::Category, "c1").modifiedMarker, qint64(1000));
}

void TestLocalStore::testMarkerNeverGoesBackwards()
{
    SyncRecord category = Records::makeCategory("c1", "Food", "cart");
    category.modifiedMarker = 4102444800000;  // far future, from a skewed clock
    m_store->applyRemote(category);

    SyncRecord edit = m_store->record(Records::Category, "c1");
    edit.setField("icon", "basket");
    edit.modifiedMarker = 5;
    m_store->save(edit);

    QCOMPARE(m_store->record(Records::Category, "c1").modifiedMarker, qint64(4102444800001));
}

// ========== Outbox Tests ==========

void TestLocalStore::testSaveQueuesChange()
{
    m_store->save(Records::makeCategory("c1", "Food", "cart"));
    m_store->save(Records::makeCategory("c2", "Bills", "doc"));

    QCOMPARE(m_store->pendingChangeCount(), 2);
    QCOMPARE(m_store->pendingChanges().size(), 2);
    QVERIFY(m_store->isPending(Records::Category, "c1"));
}

void TestLocalStore::testMarkPushedClearsEntry()
{
    m_store->save(Records::makeCategory("c1", "Food", "cart"));
    SyncRecord pushed = m_store->record(Records::Category, "c1");

    QVERIFY(m_store->markPushed(pushed));
    QCOMPARE(m_store->pendingChangeCount(), 0);
    QVERIFY(m_store->contains(Records::Category, "c1"));
}

void TestLocalStore::testMarkPushedKeepsNewerChange()
{
    m_store->save(Records::makeCategory("c1", "Food", "cart"));
    SyncRecord pushed = m_store->record(Records::Category, "c1");

    SyncRecord edit = pushed;
    edit.setField("icon", "basket");
    m_store->save(edit);

    QVERIFY(!m_store->markPushed(pushed));
    QVERIFY(m_store->isPending(Records::Category, "c1"));
}

void TestLocalStore::testApplyRemoteBypassesOutbox()
{
    SyncRecord remote = Records::makeCategory("c1", "Food", "cart");
    remote.modifiedMarker = 1;
    QVERIFY(m_store->applyRemote(remote));

    QCOMPARE(m_store->pendingChangeCount(), 0);
    QCOMPARE(m_store->record(Records::Category, "c1").modifiedMarker, qint64(1));
}

void TestLocalStore::testApplyRemoteClearsPending()
{
    m_store->save(Records::makeCategory("c1", "Food", "cart"));
    QVERIFY(m_store->isPending(Records::Category, "c1"));

    SyncRecord remote = Records::makeCategory("c1", "Groceries", "cart");
    remote.modifiedMarker = QDateTime::currentMSecsSinceEpoch() + 60000;
    m_store->applyRemote(remote);

    QVERIFY(!m_store->isPending(Records::Category, "c1"));
    QCOMPARE(m_store->record(Records::Category, "c1").field("name").toString(), QString("Groceries"));
}

// ========== Conditional Write Tests ==========

void TestLocalStore::testSnapshot()
{
    RecordSnapshot absent = m_store->snapshot(Records::Expense, "e1");
    QVERIFY(!absent.record.isValid());
    QVERIFY(!absent.pending);

    SyncRecord expense = Records::makeExpense("e1", 12, QDateTime::currentDateTimeUtc());
    expense.modifiedMarker = 100;
    QVERIFY(m_store->save(expense));

    RecordSnapshot current = m_store->snapshot(Records::Expense, "e1");
    QCOMPARE(current.record.modifiedMarker, qint64(100));
    QVERIFY(current.pending);
    QCOMPARE(current.pendingMarker, qint64(100));
}

void TestLocalStore::testConditionalApplyWhenUnchanged()
{
    SyncRecord expense = Records::makeExpense("e1", 12, QDateTime::currentDateTimeUtc());
    expense.modifiedMarker = 100;
    QVERIFY(m_store->applyRemote(expense));

    RecordSnapshot current = m_store->snapshot(Records::Expense, "e1");
    SyncRecord remote = expense;
    remote.setField("notes", "from server");
    remote.modifiedMarker = 200;

    QCOMPARE(m_store->applyRemoteIfUnchanged(remote, current), LocalStore::WriteResult::Written);
    QCOMPARE(m_store->record(Records::Expense, "e1").field("notes").toString(), QString("from server"));
}

void TestLocalStore::testConditionalApplyKeepsInterleavedSave()
{
    SyncRecord expense = Records::makeExpense("e1", 12, QDateTime::currentDateTimeUtc());
    expense.modifiedMarker = 100;
    QVERIFY(m_store->applyRemote(expense));

    // Sync reads, the user edits, then sync writes what it pulled
    RecordSnapshot current = m_store->snapshot(Records::Expense, "e1");

    SyncRecord edited = m_store->record(Records::Expense, "e1");
    edited.setField("notes", "edited");
    edited.modifiedMarker = 0;
    QVERIFY(m_store->save(edited));

    SyncRecord remote = expense;
    remote.setField("notes", "from server");
    remote.modifiedMarker = 200;
    QSignalSpy changedSpy(m_store, &LocalStore::recordChanged);

    QCOMPARE(m_store->applyRemoteIfUnchanged(remote, current), LocalStore::WriteResult::Stale);
    QCOMPARE(m_store->record(Records::Expense, "e1").field("notes").toString(), QString("edited"));
    QVERIFY(m_store->isPending(Records::Expense, "e1"));
    QCOMPARE(m_store->pendingChangeCount(), 1);
    QCOMPARE(changedSpy.count(), 0);
}

void TestLocalStore::testConditionalApplyKeepsNewRecord()
{
    RecordSnapshot current = m_store->snapshot(Records::Expense, "e1");

    SyncRecord local = Records::makeExpense("e1", 5, QDateTime::currentDateTimeUtc());
    local.setField("notes", "typed offline");
    QVERIFY(m_store->save(local));

    SyncRecord remote = Records::makeExpense("e1", 7, QDateTime::currentDateTimeUtc());
    remote.modifiedMarker = QDateTime::currentMSecsSinceEpoch() + 60000;

    QCOMPARE(m_store->applyRemoteIfUnchanged(remote, current), LocalStore::WriteResult::Stale);
    QCOMPARE(m_store->record(Records::Expense, "e1").field("notes").toString(), QString("typed offline"));
    QVERIFY(m_store->isPending(Records::Expense, "e1"));
}

void TestLocalStore::testConditionalSaveKeepsInterleavedSave()
{
    SyncRecord expense = Records::makeExpense("e1", 12, QDateTime::currentDateTimeUtc());
    expense.setField("notes", "first");
    QVERIFY(m_store->save(expense));

    RecordSnapshot current = m_store->snapshot(Records::Expense, "e1");

    SyncRecord second = m_store->record(Records::Expense, "e1");
    second.setField("notes", "second");
    second.modifiedMarker = 0;
    QVERIFY(m_store->save(second));

    SyncRecord merged = current.record;
    merged.setField("categoryId", "default-food");
    merged.modifiedMarker = current.record.modifiedMarker + 1;

    QCOMPARE(m_store->saveIfUnchanged(merged, current), LocalStore::WriteResult::Stale);
    SyncRecord stored = m_store->record(Records::Expense, "e1");
    QCOMPARE(stored.field("notes").toString(), QString("second"));
    QVERIFY(stored.field("categoryId").toString().isEmpty());
    QVERIFY(m_store->isPending(Records::Expense, "e1"));
}

// ========== Summary Tests ==========

void TestLocalStore::testSummary()
{
    m_store->save(Records::makeCategory("c1", "Food", "cart"));
    m_store->save(Records::makeCategory("c2", "Bills", "doc"));
    m_store->save(Records::makeExpense("e1", 3, QDateTime::currentDateTimeUtc()));
    m_store->remove(Records::Category, "c2");

    StoreSummary summary = m_store->summary();
    QCOMPARE(summary.counts.value(Records::Category), 1);
    QCOMPARE(summary.counts.value(Records::Expense), 1);
    QVERIFY(summary.counts.contains(Records::RecurringExpense));
    QCOMPARE(summary.counts.value(Records::RecurringExpense), 0);
    QCOMPARE(summary.tombstones, 1);
    QCOMPARE(summary.pendingChanges, 3);

    QVERIFY(summary == m_store->summary());
    m_store->save(Records::makeExpense("e2", 4, QDateTime::currentDateTimeUtc()));
    QVERIFY(summary != m_store->summary());
}

// ========== JsonFileStore Tests ==========

void TestLocalStore::testJsonCreatesFile()
{
    JsonFileStore store(storeDir(), StoreSchema::full());
    QVERIFY(store.open(false));
    QVERIFY(store.isOpen());
    QVERIFY(!store.isReplicating());
    QVERIFY(QFile::exists(store.storeFilePath()));

    QFile file(store.storeFilePath());
    QVERIFY(file.open(QIODevice::ReadOnly));
    QJsonObject root = QJsonDocument::fromJson(file.readAll()).object();
    QCOMPARE(root["format"].toString(), JsonFileStore::FORMAT);
    QCOMPARE(root["schemaVersion"].toInt(), StoreSchema::CURRENT_VERSION);
}

void TestLocalStore::testJsonReopenKeepsState()
{
    {
        JsonFileStore store(storeDir(), StoreSchema::full());
        QVERIFY(store.open(true, "ledgersync.test"));
        store.save(Records::makeCategory("c1", "Food", "cart"));
        SyncRecord remote = Records::makeExpense("e1", 9, QDateTime::currentDateTimeUtc(), "coffee");
        remote.modifiedMarker = 77;
        store.applyRemote(remote);
        QVERIFY(store.setPullToken(12));
    }

    JsonFileStore reopened(storeDir(), StoreSchema::full());
    QVERIFY(reopened.open(true, "ledgersync.test"));
    QVERIFY(reopened.isReplicating());
    QCOMPARE(reopened.fetch(Records::Category).size(), 1);
    QCOMPARE(reopened.record(Records::Expense, "e1").field("notes").toString(), QString("coffee"));
    QCOMPARE(reopened.record(Records::Expense, "e1").modifiedMarker, qint64(77));
    QCOMPARE(reopened.pendingChangeCount(), 1);
    QVERIFY(reopened.isPending(Records::Category, "c1"));
    QCOMPARE(reopened.pullToken(), qint64(12));
}

void TestLocalStore::testJsonCorruptFile()
{
    QDir().mkpath(storeDir());
    QFile file(QDir(storeDir()).filePath("store.json"));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    JsonFileStore store(storeDir(), StoreSchema::full());
    QVERIFY(!store.open(false));
    QCOMPARE(store.lastError(), ErrorKind::StorageError);
    QVERIFY(!store.errorString().isEmpty());
}

void TestLocalStore::testJsonSchemaMismatch()
{
    {
        JsonFileStore old(storeDir(), StoreSchema("full", 1, Records::allKinds()));
        QVERIFY(old.open(false));
    }

    JsonFileStore store(storeDir(), StoreSchema::full());
    QVERIFY(!store.open(false));
    QCOMPARE(store.lastError(), ErrorKind::SchemaIncompatible);
}

void TestLocalStore::testJsonBindingMismatch()
{
    {
        JsonFileStore store(storeDir(), StoreSchema::full());
        QVERIFY(store.open(true, "container.one"));
    }

    JsonFileStore other(storeDir(), StoreSchema::full());
    QVERIFY(!other.open(true, "container.two"));
    QCOMPARE(other.lastError(), ErrorKind::Configuration);
}

void TestLocalStore::testJsonReplicatingWithoutContainer()
{
    JsonFileStore store(storeDir(), StoreSchema::full());
    QVERIFY(!store.open(true, QString()));
    QCOMPARE(store.lastError(), ErrorKind::Configuration);
}

void TestLocalStore::testJsonLocalOpenIgnoresBinding()
{
    {
        JsonFileStore store(storeDir(), StoreSchema::full());
        QVERIFY(store.open(true, "container.one"));
    }

    JsonFileStore local(storeDir(), StoreSchema::full());
    QVERIFY(local.open(false));
    QVERIFY(!local.isReplicating());
}

void TestLocalStore::testJsonDestroy()
{
    {
        JsonFileStore store(storeDir(), StoreSchema::full());
        QVERIFY(store.open(true, "container.one"));
        store.save(Records::makeCategory("c1", "Food", "cart"));
    }

    QString error;
    QVERIFY(JsonFileStore::destroy(storeDir(), &error));
    QVERIFY(!QFile::exists(QDir(storeDir()).filePath("store.json")));
    QVERIFY(!QFile::exists(QDir(storeDir()).filePath("binding.json")));

    JsonFileStore fresh(storeDir(), StoreSchema::full());
    QVERIFY(fresh.open(true, "container.two"));
    QCOMPARE(fresh.fetch(Records::Category).size(), 0);
}

QTEST_MAIN(TestLocalStore)
#include "test_localstore.moc"
