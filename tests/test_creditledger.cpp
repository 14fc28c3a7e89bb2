// Credit ledger - baseline capture, residual adjustments, derived hours

#include <QSqlQuery>
#include <QStringList>

#include "errorhandling.h"
#include "errormanager.h"

#include "ledgertestfixture.h"

namespace {

class CreditLedgerTest : public LedgerTest {};

Allocation bodyShare(const QString& employee, double percent)
{
    Allocation allocation;
    allocation.employee = employee;
    allocation.role = RepairOrder::ROLE_BODY_TECH;
    allocation.percent = percent;
    return allocation;
}

const QStringList REASSEMBLY_FIRST{"New Entry", "Intake", "Disassembly", "Body", "Reassembly",
                                   "Paint", "Detail", "QC", "Deliver"};
const QStringList DEFAULT_STAGES{"New Entry", "Intake", "Disassembly", "Body", "Paint",
                                 "Reassembly", "Detail", "QC", "Deliver"};

}  // namespace

// --- Baseline capture ---

TEST_F(CreditLedgerTest, BodyToPaint_CapturesBaselineAndCreditsSixtyPercent) {
    createRo("RO-1001", 40.0);
    move("RO-1001", "Body", "Paint");

    ASSERT_TRUE(m_ledger->recompute("RO-1001"));

    CreditBaseline baseline;
    ASSERT_TRUE(ledgerDb()->findBaseline("RO-1001", "body_60", baseline));
    EXPECT_DOUBLE_EQ(baseline.baseHours, 40.0);
    EXPECT_EQ(baseline.fromStage, "Body");
    EXPECT_EQ(baseline.toStage, "Paint");
    EXPECT_EQ(baseline.date, "2026-03-02");
    EXPECT_EQ(ledgerDb()->adjustmentCount("RO-1001"), 0);

    QList<CreditRow> rows = m_ledger->generatedCreditRows("RO-1001");
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].employee, "Tony");
    EXPECT_DOUBLE_EQ(rows[0].hours, 24.0);
    EXPECT_EQ(rows[0].note, "Body 60% of 40.00h on Body" + arrow() + "Paint");
    EXPECT_EQ(rows[0].kind, CreditRowKind::Baseline);
}

TEST_F(CreditLedgerTest, NoMatchingTransition_NoBaselineNoCredit) {
    createRo("RO-1002", 40.0);
    move("RO-1002", "Body", "Disassembly");

    ASSERT_TRUE(m_ledger->recompute("RO-1002"));

    CreditBaseline baseline;
    EXPECT_FALSE(ledgerDb()->findBaseline("RO-1002", "body_60", baseline));
    EXPECT_TRUE(m_ledger->generatedCreditRows("RO-1002").isEmpty());
    EXPECT_TRUE(auditLog()->entries("RO-1002").isEmpty());
}

TEST_F(CreditLedgerTest, ZeroBucket_WaitsForHoursBeforeBaseline) {
    createRo("RO-1003", 0.0);
    move("RO-1003", "Body", "Paint");
    ASSERT_TRUE(m_ledger->recompute("RO-1003"));

    CreditBaseline baseline;
    EXPECT_FALSE(ledgerDb()->findBaseline("RO-1003", "body_60", baseline));

    setBucket("RO-1003", RepairOrder::BODY_HOURS, 30.0);
    ASSERT_TRUE(m_ledger->recompute("RO-1003"));

    ASSERT_TRUE(ledgerDb()->findBaseline("RO-1003", "body_60", baseline));
    EXPECT_DOUBLE_EQ(baseline.baseHours, 30.0);
    EXPECT_EQ(ledgerDb()->adjustmentCount("RO-1003"), 0);
}

TEST_F(CreditLedgerTest, UnassignedRole_WaitsForEmployee) {
    createRo("RO-1004", 40.0);
    ASSERT_TRUE(RepairOrderDBManager::instance()->setAssignment("RO-1004", RepairOrder::ROLE_BODY_TECH, ""));
    move("RO-1004", "Body", "Paint");
    ASSERT_TRUE(m_ledger->recompute("RO-1004"));

    CreditBaseline baseline;
    EXPECT_FALSE(ledgerDb()->findBaseline("RO-1004", "body_60", baseline));

    ASSERT_TRUE(RepairOrderDBManager::instance()->setAssignment("RO-1004", RepairOrder::ROLE_BODY_TECH, "Tony"));
    ASSERT_TRUE(m_ledger->recompute("RO-1004"));
    EXPECT_TRUE(ledgerDb()->findBaseline("RO-1004", "body_60", baseline));
}

TEST_F(CreditLedgerTest, FirstMatchingTransitionAnchorsBaseline) {
    createRo("RO-1005", 40.0);
    move("RO-1005", "Body", "Reassembly");
    move("RO-1005", "Reassembly", "Body");
    move("RO-1005", "Body", "Paint");

    ASSERT_TRUE(m_ledger->recompute("RO-1005"));

    CreditBaseline baseline;
    ASSERT_TRUE(ledgerDb()->findBaseline("RO-1005", "body_60", baseline));
    EXPECT_EQ(baseline.toStage, "Reassembly");
}

TEST_F(CreditLedgerTest, FullRoute_PaysEveryMilestone) {
    createRo("RO-1006", 40.0, 12.0);
    move("RO-1006", "Body", "Paint");
    move("RO-1006", "Paint", "Reassembly");
    move("RO-1006", "Reassembly", "Detail");

    ASSERT_TRUE(m_ledger->recompute("RO-1006"));

    QList<CreditRow> rows = m_ledger->generatedCreditRows("RO-1006");
    ASSERT_EQ(rows.size(), 3);

    double tony = 0.0;
    double pat = 0.0;
    for (const CreditRow& row : rows) {
        if (row.employee == "Tony") {
            tony += row.hours;
        } else if (row.employee == "Pat") {
            pat += row.hours;
        }
    }
    EXPECT_NEAR(tony, 40.0, 1e-9);
    EXPECT_NEAR(pat, 12.0, 1e-9);
}

// --- Adjustments ---

TEST_F(CreditLedgerTest, BucketEdit_AddsOneSupplement) {
    createRo("RO-1001", 40.0);
    move("RO-1001", "Body", "Paint");
    ASSERT_TRUE(m_ledger->recompute("RO-1001"));

    setBucket("RO-1001", RepairOrder::BODY_HOURS, 50.0);
    ASSERT_TRUE(m_ledger->recompute("RO-1001"));

    QList<CreditAdjustment> adjustments = ledgerDb()->adjustmentsFor("RO-1001", "body_60");
    ASSERT_EQ(adjustments.size(), 1);
    EXPECT_DOUBLE_EQ(adjustments[0].deltaHours, 10.0);
    EXPECT_DOUBLE_EQ(adjustments[0].share, 0.6);
    EXPECT_EQ(adjustments[0].tech, "Tony");
    EXPECT_EQ(adjustments[0].fromStage, "Body");
    EXPECT_EQ(adjustments[0].toStage, "Paint");
    EXPECT_EQ(adjustments[0].date, QDate::currentDate().toString("yyyy-MM-dd"));

    QList<CreditRow> rows = m_ledger->generatedCreditRows("RO-1001");
    ASSERT_EQ(rows.size(), 2);
    EXPECT_EQ(rows[1].note, "Supplement +10.00h (Body 60%)");
    EXPECT_EQ(rows[1].employee, "Tony");
    EXPECT_NEAR(rows[1].hours, 6.0, 1e-9);
    EXPECT_EQ(rows[1].kind, CreditRowKind::Supplement);
    EXPECT_NEAR(totalHours(rows), 30.0, 1e-9);
}

TEST_F(CreditLedgerTest, BucketReduced_AddsNegativeSupplement) {
    createRo("RO-1007", 40.0);
    move("RO-1007", "Body", "Paint");
    ASSERT_TRUE(m_ledger->recompute("RO-1007"));

    setBucket("RO-1007", RepairOrder::BODY_HOURS, 30.0);
    ASSERT_TRUE(m_ledger->recompute("RO-1007"));

    QList<CreditRow> rows = m_ledger->generatedCreditRows("RO-1007");
    ASSERT_EQ(rows.size(), 2);
    EXPECT_EQ(rows[1].note, "Supplement -10.00h (Body 60%)");
    EXPECT_NEAR(rows[1].hours, -6.0, 1e-9);
    EXPECT_NEAR(totalHours(rows), 18.0, 1e-9);
}

TEST_F(CreditLedgerTest, Recompute_IsIdempotent) {
    createRo("RO-1001", 40.0);
    move("RO-1001", "Body", "Paint");
    ASSERT_TRUE(m_ledger->recompute("RO-1001"));
    setBucket("RO-1001", RepairOrder::BODY_HOURS, 50.0);
    ASSERT_TRUE(m_ledger->recompute("RO-1001"));

    const int adjustments = ledgerDb()->adjustmentCount("RO-1001");
    const int entries = auditLog()->entries("RO-1001").size();

    ASSERT_TRUE(m_ledger->recompute("RO-1001"));
    ASSERT_TRUE(m_ledger->recompute("RO-1001"));

    EXPECT_EQ(ledgerDb()->adjustmentCount("RO-1001"), adjustments);
    EXPECT_EQ(auditLog()->entries("RO-1001").size(), entries);
}

TEST_F(CreditLedgerTest, BaselineNeverChangesAfterEdits) {
    createRo("RO-1008", 40.0);
    move("RO-1008", "Body", "Paint");
    ASSERT_TRUE(m_ledger->recompute("RO-1008"));

    for (double hours : {50.0, 35.0, 62.5}) {
        setBucket("RO-1008", RepairOrder::BODY_HOURS, hours);
        ASSERT_TRUE(m_ledger->recompute("RO-1008"));
    }

    CreditBaseline baseline;
    ASSERT_TRUE(ledgerDb()->findBaseline("RO-1008", "body_60", baseline));
    EXPECT_DOUBLE_EQ(baseline.baseHours, 40.0);
}

TEST_F(CreditLedgerTest, BaselinePlusAdjustmentsMatchesBucket) {
    createRo("RO-1009", 40.0, 8.0);
    move("RO-1009", "Body", "Paint");
    move("RO-1009", "Paint", "Reassembly");
    move("RO-1009", "Reassembly", "Detail");
    ASSERT_TRUE(m_ledger->recompute("RO-1009"));

    setBucket("RO-1009", RepairOrder::BODY_HOURS, 47.3);
    setBucket("RO-1009", RepairOrder::REFINISH_HOURS, 6.1);
    ASSERT_TRUE(m_ledger->recompute("RO-1009"));
    setBucket("RO-1009", RepairOrder::BODY_HOURS, 44.9);
    ASSERT_TRUE(m_ledger->recompute("RO-1009"));

    const RepairOrder ro = load("RO-1009");
    const MilestonePolicy policy = MilestonePolicy::defaultPolicy();
    for (const Milestone& milestone : policy.milestones()) {
        CreditBaseline baseline;
        ASSERT_TRUE(ledgerDb()->findBaseline("RO-1009", milestone.id, baseline));
        const double applied = baseline.baseHours + ledgerDb()->sumAdjustments("RO-1009", milestone.id);
        EXPECT_NEAR(applied, ro.bucket(milestone.bucket), 1e-6) << milestone.id.toStdString();
    }
}

TEST_F(CreditLedgerTest, RepeatedEqualSupplements_GetDistinctNotes) {
    createRo("RO-1010", 40.0);
    move("RO-1010", "Body", "Paint");
    ASSERT_TRUE(m_ledger->recompute("RO-1010"));

    setBucket("RO-1010", RepairOrder::BODY_HOURS, 50.0);
    ASSERT_TRUE(m_ledger->recompute("RO-1010"));
    setBucket("RO-1010", RepairOrder::BODY_HOURS, 60.0);
    ASSERT_TRUE(m_ledger->recompute("RO-1010"));

    QList<CreditRow> rows = m_ledger->generatedCreditRows("RO-1010");
    ASSERT_EQ(rows.size(), 3);
    EXPECT_EQ(rows[1].note, "Supplement +10.00h (Body 60%)");
    EXPECT_EQ(rows[2].note, "Supplement +10.00h (Body 60%) (2)");

    // Both supplements reached the audit log
    EXPECT_EQ(auditLog()->entries("RO-1010").size(), 3);
}

// --- Derived fields ---

TEST_F(CreditLedgerTest, Recompute_WritesHoursTakenAndRemaining) {
    createRo("RO-1011", 40.0, 0.0, 0.0, 30.0);
    move("RO-1011", "Body", "Paint");
    ASSERT_TRUE(m_ledger->recompute("RO-1011"));

    RepairOrder ro = load("RO-1011");
    EXPECT_DOUBLE_EQ(ro.hoursTaken, 24.0);
    EXPECT_DOUBLE_EQ(ro.hoursRemaining, 6.0);

    setBucket("RO-1011", RepairOrder::BODY_HOURS, 60.0);
    ASSERT_TRUE(m_ledger->recompute("RO-1011"));

    ro = load("RO-1011");
    EXPECT_DOUBLE_EQ(ro.hoursTaken, 36.0);
    EXPECT_DOUBLE_EQ(ro.hoursRemaining, 0.0);
}

// --- Read-only rows ---

TEST_F(CreditLedgerTest, GeneratedRows_DoNotWrite) {
    createRo("RO-1012", 40.0);
    move("RO-1012", "Body", "Paint");

    QList<CreditRow> rows = m_ledger->generatedCreditRows("RO-1012");
    ASSERT_EQ(rows.size(), 1);
    EXPECT_DOUBLE_EQ(rows[0].hours, 24.0);

    CreditBaseline baseline;
    EXPECT_FALSE(ledgerDb()->findBaseline("RO-1012", "body_60", baseline));
    EXPECT_TRUE(auditLog()->entries("RO-1012").isEmpty());
}

TEST_F(CreditLedgerTest, UnknownRo_RecomputeReturnsFalse) {
    EXPECT_FALSE(m_ledger->recompute("RO-9999"));
    EXPECT_TRUE(m_ledger->generatedCreditRows("RO-9999").isEmpty());
}

TEST_F(CreditLedgerTest, RecomputeAll_CoversEveryRo) {
    createRo("RO-2001", 40.0);
    createRo("RO-2002", 20.0);
    move("RO-2001", "Body", "Paint");
    move("RO-2002", "Body", "Paint");

    EXPECT_EQ(m_ledger->recomputeAll(), 2);
    EXPECT_EQ(auditLog()->entries("RO-2001").size(), 1);
    EXPECT_EQ(auditLog()->entries("RO-2002").size(), 1);
}

TEST_F(CreditLedgerTest, RecomputeAll_FailingRoDoesNotBlockOthers) {
    createRo("RO-2003", 40.0);
    createRo("RO-2004", 20.0);
    move("RO-2003", "Body", "Paint");
    move("RO-2004", "Body", "Paint");

    QSqlQuery trigger(DatabaseManager::instance()->getDatabase());
    ASSERT_TRUE(trigger.exec("CREATE TRIGGER reject_ro_2003 BEFORE INSERT ON credit_baseline "
                             "WHEN NEW.ro_number = 'RO-2003' "
                             "BEGIN SELECT RAISE(ABORT, 'baseline rejected'); END"));

    EXPECT_THROW(m_ledger->recompute("RO-2003"), DatabaseException);

    const int errorsBefore = ErrorManager::instance().errorCount();
    EXPECT_EQ(m_ledger->recomputeAll(), 1);
    EXPECT_EQ(ErrorManager::instance().errorCount(), errorsBefore + 1);

    // The failed RO rolled back whole, the other one is credited
    CreditBaseline baseline;
    EXPECT_FALSE(ledgerDb()->findBaseline("RO-2003", "body_60", baseline));
    EXPECT_TRUE(auditLog()->entries("RO-2003").isEmpty());
    ASSERT_EQ(auditLog()->entries("RO-2004").size(), 1);
    EXPECT_DOUBLE_EQ(auditLog()->entries("RO-2004")[0].hours, 12.0);
}

// --- Configuration ---

TEST_F(CreditLedgerTest, StageOrderIsReadPerCall) {
    createRo("RO-1013", 40.0);
    move("RO-1013", "Body", "Reassembly");
    EXPECT_EQ(m_ledger->generatedCreditRows("RO-1013").size(), 1);

    // Reassembly ahead of Paint: the move no longer reaches the body milestone
    ConfigManager::instance().setValue("Ledger/Stages", REASSEMBLY_FIRST);
    EXPECT_TRUE(m_ledger->generatedCreditRows("RO-1013").isEmpty());

    ConfigManager::instance().setValue("Ledger/Stages", DEFAULT_STAGES);
    EXPECT_EQ(m_ledger->generatedCreditRows("RO-1013").size(), 1);
}

TEST_F(CreditLedgerTest, CapturedBaselineSurvivesStageReorder) {
    createRo("RO-1014", 40.0);
    move("RO-1014", "Body", "Reassembly");
    ASSERT_TRUE(m_ledger->recompute("RO-1014"));

    ConfigManager::instance().setValue("Ledger/Stages", REASSEMBLY_FIRST);
    ASSERT_TRUE(m_ledger->recompute("RO-1014"));

    QList<CreditRow> rows = m_ledger->generatedCreditRows("RO-1014");
    ASSERT_EQ(rows.size(), 1);
    EXPECT_DOUBLE_EQ(rows[0].hours, 24.0);
}

TEST_F(CreditLedgerTest, UnknownCreditMode_Throws) {
    createRo("RO-1015", 40.0);
    ConfigManager::instance().setValue("Ledger/CreditMode", "weighted");
    EXPECT_THROW(m_ledger->recompute("RO-1015"), ConfigurationException);
}

// --- Allocation mode ---

TEST_F(CreditLedgerTest, AllocationMode_SplitsRowsPerEmployee) {
    ConfigManager::instance().setValue("Ledger/CreditMode", "allocation");
    createRo("RO-1016", 40.0);
    QList<Allocation> allocations;
    allocations.append(bodyShare("Alice", 50.0));
    allocations.append(bodyShare("Bob", 50.0));
    ASSERT_TRUE(RepairOrderDBManager::instance()->setAllocations("RO-1016", RepairOrder::ROLE_BODY_TECH, allocations));
    move("RO-1016", "Body", "Paint");

    ASSERT_TRUE(m_ledger->recompute("RO-1016"));

    QList<CreditRow> rows = m_ledger->generatedCreditRows("RO-1016");
    ASSERT_EQ(rows.size(), 2);
    EXPECT_EQ(rows[0].employee, "Alice");
    EXPECT_DOUBLE_EQ(rows[0].hours, 12.0);
    EXPECT_EQ(rows[0].note, "Body 60% of 40.00h on Body" + arrow() + "Paint [Alice 50%]");
    EXPECT_EQ(rows[1].employee, "Bob");
    EXPECT_DOUBLE_EQ(rows[1].hours, 12.0);

    setBucket("RO-1016", RepairOrder::BODY_HOURS, 50.0);
    ASSERT_TRUE(m_ledger->recompute("RO-1016"));

    rows = m_ledger->generatedCreditRows("RO-1016");
    ASSERT_EQ(rows.size(), 4);
    EXPECT_EQ(rows[2].note, "Supplement +10.00h (Body 60%) [Alice 50%]");
    EXPECT_NEAR(rows[2].hours, 3.0, 1e-9);
    EXPECT_NEAR(totalHours(rows), 30.0, 1e-9);

    QList<CreditAdjustment> adjustments = ledgerDb()->adjustmentsFor("RO-1016");
    ASSERT_EQ(adjustments.size(), 1);
    EXPECT_TRUE(adjustments[0].tech.isEmpty());
}
