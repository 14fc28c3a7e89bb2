#include "ledgertestfixture.h"

namespace {

class StageTransitionLogTest : public LedgerTest {};

}  // namespace

TEST_F(StageTransitionLogTest, RecordTransition_ReturnsId) {
    createRo("RO-3001", 10.0);
    const qint64 id = StageTransitionLog::instance()->recordTransition("RO-3001", "Body", "Paint", m_clock);
    EXPECT_GT(id, 0);
    EXPECT_EQ(StageTransitionLog::instance()->transitionCount("RO-3001"), 1);
}

TEST_F(StageTransitionLogTest, TransitionsFor_OrderedByTime) {
    createRo("RO-3002", 10.0);
    StageTransitionLog* log = StageTransitionLog::instance();
    ASSERT_GT(log->recordTransition("RO-3002", "Paint", "Reassembly", m_clock.addSecs(120)), 0);
    ASSERT_GT(log->recordTransition("RO-3002", "Body", "Paint", m_clock.addSecs(60)), 0);

    const QList<StageTransition> transitions = log->transitionsFor("RO-3002");
    ASSERT_EQ(transitions.size(), 2);
    EXPECT_EQ(transitions[0].fromStage, "Body");
    EXPECT_EQ(transitions[1].fromStage, "Paint");
    EXPECT_EQ(transitions[0].occurredAt, "2026-03-02 08:01:00");
    EXPECT_EQ(transitions[0].date(), "2026-03-02");
}

TEST_F(StageTransitionLogTest, SameTimestamp_KeepsInsertionOrder) {
    createRo("RO-3003", 10.0);
    StageTransitionLog* log = StageTransitionLog::instance();
    ASSERT_GT(log->recordTransition("RO-3003", "Body", "Reassembly", m_clock), 0);
    ASSERT_GT(log->recordTransition("RO-3003", "Reassembly", "Body", m_clock), 0);

    const QList<StageTransition> transitions = log->transitionsFor("RO-3003");
    ASSERT_EQ(transitions.size(), 2);
    EXPECT_EQ(transitions[0].toStage, "Reassembly");
    EXPECT_EQ(transitions[1].toStage, "Body");
    EXPECT_LT(transitions[0].id, transitions[1].id);
}

TEST_F(StageTransitionLogTest, OtherRos_AreNotMixedIn) {
    createRo("RO-3004", 10.0);
    createRo("RO-3005", 10.0);
    move("RO-3004", "Body", "Paint");
    move("RO-3005", "Body", "Paint");
    move("RO-3005", "Paint", "Reassembly");

    EXPECT_EQ(StageTransitionLog::instance()->transitionsFor("RO-3004").size(), 1);
    EXPECT_EQ(StageTransitionLog::instance()->transitionsFor("RO-3005").size(), 2);
}

TEST_F(StageTransitionLogTest, UnknownRo_IsRejected) {
    EXPECT_EQ(StageTransitionLog::instance()->recordTransition("RO-9999", "Body", "Paint", m_clock), 0);
}

TEST_F(StageTransitionLogTest, DeletingRo_RemovesItsTransitions) {
    createRo("RO-3006", 10.0);
    move("RO-3006", "Body", "Paint");
    ASSERT_TRUE(RepairOrderDBManager::instance()->deleteRepairOrder("RO-3006"));
    EXPECT_EQ(StageTransitionLog::instance()->transitionCount("RO-3006"), 0);
}
