// Operator overrides and supplement deletion

#include "ledgertestfixture.h"

namespace {

class OverrideTest : public LedgerTest {
  protected:
    // RO at Paint with a captured 40h body baseline
    void paintedRo(const QString& roNumber) {
        createRo(roNumber, 40.0);
        move(roNumber, "Body", "Paint");
        ASSERT_TRUE(m_ledger->recompute(roNumber));
    }

    CreditRow rowWithNote(const QString& roNumber, const QString& note) {
        const QList<CreditRow> rows = m_ledger->generatedCreditRows(roNumber);
        for (const CreditRow& row : rows) {
            if (row.note == note) {
                return row;
            }
        }
        ADD_FAILURE() << "no row " << note.toStdString();
        return CreditRow();
    }

    static CreditOverride hoursOverride(const CreditRow& row, double hours) {
        CreditOverride creditOverride;
        creditOverride.key = row.key();
        creditOverride.hasHours = true;
        creditOverride.hours = hours;
        return creditOverride;
    }

    CreditOverrideDBManager* overrides() { return CreditOverrideDBManager::instance(); }
};

const char* const SUPPLEMENT_NOTE = "Supplement +10.00h (Body 60%)";

}  // namespace

// --- Overrides ---

TEST_F(OverrideTest, HoursOverride_SurvivesRecompute) {
    paintedRo("RO-5001");
    QList<CreditRow> rows = m_ledger->generatedCreditRows("RO-5001");
    ASSERT_EQ(rows.size(), 1);

    ASSERT_TRUE(m_ledger->setOverride(hoursOverride(rows[0], 20.0)));
    ASSERT_TRUE(m_ledger->recompute("RO-5001"));

    rows = m_ledger->generatedCreditRows("RO-5001");
    ASSERT_EQ(rows.size(), 1);
    EXPECT_DOUBLE_EQ(rows[0].hours, 20.0);
    EXPECT_TRUE(rows[0].overridden);
    EXPECT_DOUBLE_EQ(load("RO-5001").hoursTaken, 20.0);

    ASSERT_TRUE(m_ledger->deleteOverride(rows[0].key()));
    rows = m_ledger->generatedCreditRows("RO-5001");
    EXPECT_DOUBLE_EQ(rows[0].hours, 24.0);
    EXPECT_FALSE(rows[0].overridden);
}

TEST_F(OverrideTest, TechAndDateOverride_KeepHours) {
    paintedRo("RO-5002");
    const CreditRow row = m_ledger->generatedCreditRows("RO-5002").value(0);

    CreditOverride creditOverride;
    creditOverride.key = row.key();
    creditOverride.tech = "Sam";
    creditOverride.date = "2026-03-09";
    ASSERT_TRUE(m_ledger->setOverride(creditOverride));

    const QList<CreditRow> rows = m_ledger->generatedCreditRows("RO-5002");
    ASSERT_EQ(rows.size(), 1);
    EXPECT_EQ(rows[0].employee, "Sam");
    EXPECT_EQ(rows[0].date, "2026-03-09");
    EXPECT_DOUBLE_EQ(rows[0].hours, 24.0);
    EXPECT_EQ(rows[0].note, row.note);
}

TEST_F(OverrideTest, SetOverride_ReplacesPrevious) {
    paintedRo("RO-5003");
    const CreditRow row = m_ledger->generatedCreditRows("RO-5003").value(0);

    ASSERT_TRUE(m_ledger->setOverride(hoursOverride(row, 20.0)));
    ASSERT_TRUE(m_ledger->setOverride(hoursOverride(row, 18.5)));

    EXPECT_EQ(overrides()->overridesFor("RO-5003").size(), 1);
    CreditOverride stored;
    ASSERT_TRUE(overrides()->findOverride(row.key(), stored));
    EXPECT_DOUBLE_EQ(stored.hours, 18.5);
    EXPECT_TRUE(stored.tech.isEmpty());
}

TEST_F(OverrideTest, SetOverride_RequiresKey) {
    CreditOverride creditOverride;
    creditOverride.key.roNumber = "RO-5004";
    EXPECT_FALSE(m_ledger->setOverride(creditOverride));
}

TEST_F(OverrideTest, OverrideOnUnknownKey_ChangesNothing) {
    paintedRo("RO-5005");
    CreditOverride creditOverride;
    creditOverride.key = {"RO-5005", "Body", "Paint", "No such row"};
    creditOverride.hasHours = true;
    creditOverride.hours = 1.0;
    ASSERT_TRUE(m_ledger->setOverride(creditOverride));

    const QList<CreditRow> rows = m_ledger->generatedCreditRows("RO-5005");
    ASSERT_EQ(rows.size(), 1);
    EXPECT_DOUBLE_EQ(rows[0].hours, 24.0);
}

// --- Deleting rows ---

TEST_F(OverrideTest, BaselineRow_CannotBeDeleted) {
    paintedRo("RO-5006");
    const CreditRow row = m_ledger->generatedCreditRows("RO-5006").value(0);

    EXPECT_FALSE(m_ledger->deleteCreditRow(row));
    EXPECT_FALSE(m_ledger->deleteSupplement(row));

    CreditBaseline baseline;
    EXPECT_TRUE(ledgerDb()->findBaseline("RO-5006", "body_60", baseline));
    EXPECT_EQ(auditLog()->entries("RO-5006").size(), 1);
}

TEST_F(OverrideTest, DeleteSupplement_ReversesAdjustment) {
    paintedRo("RO-5007");
    setBucket("RO-5007", RepairOrder::BODY_HOURS, 50.0);
    ASSERT_TRUE(m_ledger->recompute("RO-5007"));

    const CreditRow supplement = rowWithNote("RO-5007", SUPPLEMENT_NOTE);
    ASSERT_TRUE(m_ledger->setOverride(hoursOverride(supplement, 5.0)));

    ASSERT_TRUE(m_ledger->deleteCreditRow(supplement));

    EXPECT_EQ(ledgerDb()->adjustmentCount("RO-5007"), 0);
    EXPECT_FALSE(auditLog()->hasEntry("RO-5007", "Tony", SUPPLEMENT_NOTE));
    EXPECT_TRUE(overrides()->overridesFor("RO-5007").isEmpty());
}

TEST_F(OverrideTest, DeleteSupplement_MatchesByRecoveredDelta) {
    paintedRo("RO-5008");
    setBucket("RO-5008", RepairOrder::BODY_HOURS, 30.0);
    ASSERT_TRUE(m_ledger->recompute("RO-5008"));

    // As the row comes back from an export: no adjustment id
    CreditRow supplement = rowWithNote("RO-5008", "Supplement -10.00h (Body 60%)");
    EXPECT_DOUBLE_EQ(supplement.hours, -6.0);
    supplement.adjustmentId = 0;

    ASSERT_TRUE(m_ledger->deleteSupplement(supplement));
    EXPECT_EQ(ledgerDb()->adjustmentCount("RO-5008"), 0);
}

TEST_F(OverrideTest, DeleteSupplement_FallsBackToNoteWhenHoursOverridden) {
    paintedRo("RO-5009");
    setBucket("RO-5009", RepairOrder::BODY_HOURS, 50.0);
    ASSERT_TRUE(m_ledger->recompute("RO-5009"));

    const CreditRow generated = rowWithNote("RO-5009", SUPPLEMENT_NOTE);
    ASSERT_TRUE(m_ledger->setOverride(hoursOverride(generated, 5.0)));

    CreditRow shown = rowWithNote("RO-5009", SUPPLEMENT_NOTE);
    EXPECT_DOUBLE_EQ(shown.hours, 5.0);
    shown.adjustmentId = 0;

    ASSERT_TRUE(m_ledger->deleteSupplement(shown));
    EXPECT_EQ(ledgerDb()->adjustmentCount("RO-5009"), 0);
}

TEST_F(OverrideTest, DeleteSupplement_UnknownAdjustmentFails) {
    paintedRo("RO-5010");

    CreditRow ghost;
    ghost.roNumber = "RO-5010";
    ghost.fromStage = "Body";
    ghost.toStage = "Paint";
    ghost.note = "Supplement +3.00h (Body 60%)";
    ghost.hours = 1.8;
    EXPECT_FALSE(m_ledger->deleteSupplement(ghost));

    ghost.note = "Supplement +3.00h (Frame 100%)";
    EXPECT_FALSE(m_ledger->deleteSupplement(ghost));
}

TEST_F(OverrideTest, DeletedSupplement_ReturnsWhileBucketDiffers) {
    paintedRo("RO-5011");
    setBucket("RO-5011", RepairOrder::BODY_HOURS, 50.0);
    ASSERT_TRUE(m_ledger->recompute("RO-5011"));

    ASSERT_TRUE(m_ledger->deleteCreditRow(rowWithNote("RO-5011", SUPPLEMENT_NOTE)));
    EXPECT_EQ(ledgerDb()->adjustmentCount("RO-5011"), 0);

    ASSERT_TRUE(m_ledger->recompute("RO-5011"));
    EXPECT_EQ(ledgerDb()->adjustmentCount("RO-5011"), 1);
    EXPECT_NEAR(totalHours(m_ledger->generatedCreditRows("RO-5011")), 30.0, 1e-9);
}

TEST_F(OverrideTest, DeleteSupplement_AllocationRemovesEveryShare) {
    ConfigManager::instance().setValue("Ledger/CreditMode", "allocation");
    createRo("RO-5012", 40.0);

    Allocation alice;
    alice.employee = "Alice";
    alice.role = RepairOrder::ROLE_BODY_TECH;
    alice.percent = 50.0;
    Allocation bob = alice;
    bob.employee = "Bob";
    ASSERT_TRUE(RepairOrderDBManager::instance()->setAllocations("RO-5012", RepairOrder::ROLE_BODY_TECH,
                                                                 QList<Allocation>{alice, bob}));
    move("RO-5012", "Body", "Paint");
    ASSERT_TRUE(m_ledger->recompute("RO-5012"));
    setBucket("RO-5012", RepairOrder::BODY_HOURS, 50.0);
    ASSERT_TRUE(m_ledger->recompute("RO-5012"));
    ASSERT_EQ(auditLog()->entries("RO-5012").size(), 4);

    ASSERT_TRUE(m_ledger->deleteCreditRow(rowWithNote("RO-5012", "Supplement +10.00h (Body 60%) [Bob 50%]")));

    EXPECT_EQ(ledgerDb()->adjustmentCount("RO-5012"), 0);
    EXPECT_EQ(auditLog()->entries("RO-5012").size(), 2);
}

TEST_F(OverrideTest, DeleteOtherRow_DropsItsOverride) {
    paintedRo("RO-5013");

    CreditRow row;
    row.roNumber = "RO-5013";
    row.note = "Manual correction";
    CreditOverride creditOverride;
    creditOverride.key = row.key();
    creditOverride.hasHours = true;
    creditOverride.hours = 1.0;
    ASSERT_TRUE(m_ledger->setOverride(creditOverride));

    EXPECT_TRUE(m_ledger->deleteCreditRow(row));
    CreditOverride stored;
    EXPECT_FALSE(overrides()->findOverride(row.key(), stored));
}
