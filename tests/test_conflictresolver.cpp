/**
 * @file test_conflictresolver.cpp
 * @brief Unit tests for ConflictResolver
 *
 * Tests last-writer-wins, field merges for expenses and the membership
 * merge for shared budgets. Every merge is checked from both sides.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include "sync/conflictresolver.h"
#include "model/recordkinds.h"

using namespace LedgerSync;

class TestConflictResolver : public QObject
{
    Q_OBJECT

private slots:
    // ========== Scalar Tests ==========
    void testIdempotent();
    void testRemoteNewerWins();
    void testLocalNewerWins();
    void testResultKeepsLocalId();
    void testEqualMarkerIdenticalContentKeepsLocal();
    void testEqualMarkerTieBreakSymmetric();

    // ========== Fieldwise Tests ==========
    void testExpenseNotesFilledFromOlderSide();
    void testExpenseConflictingValueFollowsWinner();
    void testExpenseMergeCommutative();
    void testExpenseDeleteIsWholeRecord();

    // ========== Membership Tests ==========
    void testMembershipUnion();
    void testMembershipCommutative();
    void testRemovalSurvivesMerge();
    void testConcurrentReAddAgrees();
    void testEarliestStartDate();
    void testLargestBudgetAmount();
    void testDeletedBudget();

    // ========== Configuration Tests ==========
    void testDefaultModes();
    void testCompareValues();
};

// ========== Scalar Tests ==========

void TestConflictResolver::testIdempotent()
{
    ConflictResolver resolver;
    SyncRecord category = Records::makeCategory("c1", "Food", "cart");
    category.modifiedMarker = 42;

    QVERIFY(resolver.resolve(category, category) == category);

    SyncRecord expense = Records::makeExpense("e1", 4.5, QDateTime::currentDateTimeUtc(), "tea");
    expense.modifiedMarker = 43;
    QVERIFY(resolver.resolve(expense, expense) == expense);
}

void TestConflictResolver::testRemoteNewerWins()
{
    ConflictResolver resolver;
    SyncRecord local = Records::makeCategory("c1", "Food", "cart");
    local.modifiedMarker = 100;
    SyncRecord remote = Records::makeCategory("c1", "Groceries", "basket");
    remote.modifiedMarker = 200;

    SyncRecord result = resolver.resolve(local, remote);
    QCOMPARE(result.field("name").toString(), QString("Groceries"));
    QCOMPARE(result.field("icon").toString(), QString("basket"));
    QCOMPARE(result.modifiedMarker, qint64(200));
}

void TestConflictResolver::testLocalNewerWins()
{
    ConflictResolver resolver;
    SyncRecord local = Records::makeCategory("c1", "Food", "cart");
    local.modifiedMarker = 300;
    SyncRecord remote = Records::makeCategory("c1", "Groceries", "basket");
    remote.modifiedMarker = 200;

    SyncRecord result = resolver.resolve(local, remote);
    QVERIFY(result == local);
}

void TestConflictResolver::testResultKeepsLocalId()
{
    ConflictResolver resolver;
    SyncRecord local = Records::makeCategory("local-id", "Food", "cart");
    local.modifiedMarker = 1;
    SyncRecord remote = Records::makeCategory("remote-id", "Groceries", "basket");
    remote.modifiedMarker = 2;

    QCOMPARE(resolver.resolveScalarRecord(local, remote).id, QString("local-id"));
}

void TestConflictResolver::testEqualMarkerIdenticalContentKeepsLocal()
{
    SyncRecord local = Records::makeCategory("c1", "Food", "cart");
    local.modifiedMarker = 50;
    SyncRecord remote = local;

    QVERIFY(!ConflictResolver::remoteWins(local, remote));
}

void TestConflictResolver::testEqualMarkerTieBreakSymmetric()
{
    ConflictResolver resolver;
    SyncRecord a = Records::makeCategory("c1", "Food", "cart");
    SyncRecord b = Records::makeCategory("c1", "Travel", "plane");
    a.modifiedMarker = 77;
    b.modifiedMarker = 77;

    SyncRecord onA = resolver.resolve(a, b);
    SyncRecord onB = resolver.resolve(b, a);
    QVERIFY(onA.sameContent(onB));
    QCOMPARE(onA.modifiedMarker, onB.modifiedMarker);
}

// ========== Fieldwise Tests ==========

void TestConflictResolver::testExpenseNotesFilledFromOlderSide()
{
    ConflictResolver resolver;
    QDateTime date(QDate(2024, 6, 1), QTime(9, 0), Qt::UTC);

    SyncRecord local = Records::makeExpense("e1", 20, date, "Team lunch");
    local.modifiedMarker = 100;
    SyncRecord remote = Records::makeExpense("e1", 20, date, QString(), "default-food");
    remote.modifiedMarker = 200;

    SyncRecord result = resolver.resolve(local, remote);
    QCOMPARE(result.field("notes").toString(), QString("Team lunch"));
    QCOMPARE(result.field("categoryId").toString(), QString("default-food"));
    QCOMPARE(result.modifiedMarker, qint64(200));
}

void TestConflictResolver::testExpenseConflictingValueFollowsWinner()
{
    ConflictResolver resolver;
    QDateTime date(QDate(2024, 6, 1), QTime(9, 0), Qt::UTC);

    SyncRecord local = Records::makeExpense("e1", 20, date);
    local.modifiedMarker = 100;
    SyncRecord remote = Records::makeExpense("e1", 25, date);
    remote.modifiedMarker = 200;

    QCOMPARE(resolver.resolve(local, remote).field("amount").toDouble(), 25.0);
    QCOMPARE(resolver.resolve(remote, local).field("amount").toDouble(), 25.0);
}

void TestConflictResolver::testExpenseMergeCommutative()
{
    ConflictResolver resolver;
    QDateTime date(QDate(2024, 6, 1), QTime(9, 0), Qt::UTC);

    SyncRecord a = Records::makeExpense("e1", 10, date, "Taxi");
    a.modifiedMarker = 500;
    SyncRecord b = Records::makeExpense("e1", 12, date, QString(), "default-transport");
    b.modifiedMarker = 500;

    SyncRecord ab = resolver.resolve(a, b);
    SyncRecord ba = resolver.resolve(b, a);
    QVERIFY(ab.sameContent(ba));
    QCOMPARE(ab.field("notes").toString(), QString("Taxi"));
    QCOMPARE(ab.field("categoryId").toString(), QString("default-transport"));
}

void TestConflictResolver::testExpenseDeleteIsWholeRecord()
{
    ConflictResolver resolver;
    SyncRecord local = Records::makeExpense("e1", 10, QDateTime::currentDateTimeUtc(), "Taxi");
    local.modifiedMarker = 100;
    SyncRecord remote(Records::Expense, "e1");
    remote.isDeleted = true;
    remote.modifiedMarker = 200;

    SyncRecord result = resolver.resolve(local, remote);
    QVERIFY(result.isDeleted);
    QVERIFY(result.fields.isEmpty());

    local.modifiedMarker = 300;
    QVERIFY(!resolver.resolve(local, remote).isDeleted);
}

// ========== Membership Tests ==========

void TestConflictResolver::testMembershipUnion()
{
    ConflictResolver resolver;
    QDateTime start(QDate(2024, 1, 1), QTime(0, 0), Qt::UTC);

    SyncRecord local = Records::makeSharedBudget("b1", "Trip", "alice", 500, start);
    local.addMember("bob");
    local.modifiedMarker = 10;
    SyncRecord remote = Records::makeSharedBudget("b1", "Trip", "alice", 500, start);
    remote.addMember("carol");
    remote.modifiedMarker = 20;

    SyncRecord result = resolver.resolve(local, remote);
    QCOMPARE(result.activeMembers(), QStringList({"alice", "bob", "carol"}));
}

void TestConflictResolver::testMembershipCommutative()
{
    ConflictResolver resolver;
    QDateTime start(QDate(2024, 1, 1), QTime(0, 0), Qt::UTC);

    SyncRecord a = Records::makeSharedBudget("b1", "Trip", "alice", 500, start);
    a.addMember("dave");
    a.modifiedMarker = 10;
    SyncRecord b = Records::makeSharedBudget("b1", "Holiday", "alice", 500, start);
    b.addMember("erin");
    b.modifiedMarker = 10;

    SyncRecord ab = resolver.resolve(a, b);
    SyncRecord ba = resolver.resolve(b, a);
    QVERIFY(ab.sameContent(ba));
    QCOMPARE(ab.members, ba.members);
}

void TestConflictResolver::testRemovalSurvivesMerge()
{
    ConflictResolver resolver;
    QDateTime start(QDate(2024, 1, 1), QTime(0, 0), Qt::UTC);

    SyncRecord local = Records::makeSharedBudget("b1", "Trip", "alice", 500, start);
    local.addMember("bob");
    local.removeMember("bob");
    local.modifiedMarker = 10;
    SyncRecord remote = Records::makeSharedBudget("b1", "Trip", "alice", 500, start);
    remote.addMember("bob");
    remote.modifiedMarker = 20;

    SyncRecord result = resolver.resolve(local, remote);
    QVERIFY(!result.isMember("bob"));
    QVERIFY(result.isMember("alice"));
}

void TestConflictResolver::testConcurrentReAddAgrees()
{
    ConflictResolver resolver;
    QDateTime start(QDate(2024, 1, 1), QTime(0, 0), Qt::UTC);

    // Both replicas share a history where bob was removed
    SyncRecord shared = Records::makeSharedBudget("b1", "Trip", "alice", 500, start);
    shared.addMember("bob");
    shared.removeMember("bob");
    shared.modifiedMarker = 2000;

    SyncRecord a = shared;
    QVERIFY(!a.addMember("bob"));
    QVERIFY(a.addMember("carol"));
    a.modifiedMarker = 2500;

    SyncRecord b = shared;
    b.setField("name", "Summer trip");
    b.modifiedMarker = 3000;

    SyncRecord ab = resolver.resolve(a, b);
    SyncRecord ba = resolver.resolve(b, a);
    QVERIFY(ab.sameContent(ba));

    // Nothing active on either side before the merge is dropped by it
    for (const QString &member : a.activeMembers() + b.activeMembers()) {
        QVERIFY2(ab.isMember(member), qPrintable(member));
    }
    QVERIFY(!ab.isMember("bob"));
    QCOMPARE(ab.activeMembers(), QStringList({"alice", "carol"}));
    QCOMPARE(ab.field("name").toString(), QString("Summer trip"));
}

void TestConflictResolver::testEarliestStartDate()
{
    ConflictResolver resolver;
    SyncRecord local = Records::makeSharedBudget("b1", "Trip", "alice", 500,
                                                 QDateTime(QDate(2024, 3, 1), QTime(0, 0), Qt::UTC));
    local.modifiedMarker = 900;
    SyncRecord remote = Records::makeSharedBudget("b1", "Trip", "alice", 500,
                                                  QDateTime(QDate(2024, 2, 1), QTime(0, 0), Qt::UTC));
    remote.modifiedMarker = 100;

    QCOMPARE(resolver.resolve(local, remote).field("startDate").toString(),
             QString("2024-02-01T00:00:00.000Z"));
    QCOMPARE(resolver.resolve(remote, local).field("startDate").toString(),
             QString("2024-02-01T00:00:00.000Z"));
}

void TestConflictResolver::testLargestBudgetAmount()
{
    ConflictResolver resolver;
    QDateTime start(QDate(2024, 1, 1), QTime(0, 0), Qt::UTC);

    SyncRecord local = Records::makeSharedBudget("b1", "Trip", "alice", 1200, start);
    local.modifiedMarker = 10;
    SyncRecord remote = Records::makeSharedBudget("b1", "Trip", "alice", 800, start);
    remote.modifiedMarker = 20;

    QCOMPARE(resolver.resolve(local, remote).field("budgetAmount").toDouble(), 1200.0);
    QCOMPARE(resolver.resolve(remote, local).field("budgetAmount").toDouble(), 1200.0);
}

void TestConflictResolver::testDeletedBudget()
{
    ConflictResolver resolver;
    QDateTime start(QDate(2024, 1, 1), QTime(0, 0), Qt::UTC);

    SyncRecord local = Records::makeSharedBudget("b1", "Trip", "alice", 500, start);
    local.modifiedMarker = 10;
    SyncRecord remote(Records::SharedBudget, "b1");
    remote.isDeleted = true;
    remote.modifiedMarker = 20;

    SyncRecord result = resolver.resolve(local, remote);
    QVERIFY(result.isDeleted);
    QVERIFY(result.members.isEmpty());
}

// ========== Configuration Tests ==========

void TestConflictResolver::testDefaultModes()
{
    ConflictResolver resolver;
    QCOMPARE(resolver.mergeMode(Records::Category), ConflictResolver::MergeMode::Scalar);
    QCOMPARE(resolver.mergeMode(Records::Expense), ConflictResolver::MergeMode::Fieldwise);
    QCOMPARE(resolver.mergeMode(Records::SharedBudget), ConflictResolver::MergeMode::Membership);
    QCOMPARE(resolver.fieldRule(Records::SharedBudget, "startDate"), ConflictResolver::FieldRule::Earliest);
    QCOMPARE(resolver.fieldRule(Records::Expense, "amount"), ConflictResolver::FieldRule::LastWriter);

    resolver.setMergeMode(Records::Category, ConflictResolver::MergeMode::Fieldwise);
    QCOMPARE(resolver.mergeMode(Records::Category), ConflictResolver::MergeMode::Fieldwise);
}

void TestConflictResolver::testCompareValues()
{
    QVERIFY(ConflictResolver::compareValues(9, 10) < 0);
    QVERIFY(ConflictResolver::compareValues(10.5, 10) > 0);
    QCOMPARE(ConflictResolver::compareValues(3, 3.0), 0);
    // Strings compare lexically, so "9" sorts after "10"
    QVERIFY(ConflictResolver::compareValues(QString("9"), QString("10")) > 0);
}

QTEST_MAIN(TestConflictResolver)
#include "test_conflictresolver.moc"
