// Collector_test.cpp
#include "gtest/gtest.h"
#include "Collector.h"

using namespace ipsim;

namespace {
    const auto GRAPH = std::make_shared<const StateGraph>(std::vector<std::string>{"Healthy", "Sick", "Dead"},
                                                          std::vector<Edge>{{0, 1}, {0, 2}, {1, 2}}, 0);
    const VariableLayout LAYOUT({"price"});

    StateValue careValues() {
        ValueSpec care;
        care.name = "care";
        care.states = {{"Healthy", {"price"}}, {"Sick", {"10 * price"}}};
        return StateValue(*GRAPH, {care}, LAYOUT, {0.0});
    }

    void feed(DataCollector& c, const ReplicateKey& key, const std::vector<double>& scope,
              const std::vector<EventRecord>& history, TrajectoryResult result) {
        c.reset(key, scope);
        for (const auto& record : history) c.registerEvent(record);
        c.save(result);
    }
}

TEST(StateOccupancyCollector, AbsorbingStateFillsRemainingGrid) {
    StateOccupancyCollector c(GRAPH, {0, 1, 2, 3, 4, 5, 6});
    feed(c, {0, 0, 1, 0}, {}, {{0, 1, 0.0, 2.5, false}, {1, 2, 2.5, 4.0, true}}, TrajectoryResult::ABSORBED);

    const auto& counts = c.counts().at({0, 0});
    const std::vector<int> expected = {0, 0, 0, 1, 2, 2, 2};
    for (size_t g = 0; g < expected.size(); ++g) {
        EXPECT_EQ(counts[g][expected[g]], 1) << "t=" << g;
        EXPECT_EQ(counts[g][3], 1) << "t=" << g;
    }
}

TEST(StateOccupancyCollector, CappedTrajectoryIsUnobservedAfterHorizon) {
    StateOccupancyCollector c(GRAPH, {0, 1, 2, 3, 4, 5, 6});
    feed(c, {0, 0, 1, 0}, {}, {{0, 1, 0.0, 2.5, false}, {1, 1, 2.5, 4.5, true}},
         TrajectoryResult::CAPPED_AT_HORIZON);
    feed(c, {0, 0, 2, 0}, {}, {{0, 1, 0.0, 3.0, true}}, TrajectoryResult::CAPPED_AT_HORIZON);

    const auto& counts = c.counts().at({0, 0});
    EXPECT_EQ(counts[2][0], 2);
    // the second patient arrives in Sick exactly at its horizon
    EXPECT_EQ(counts[3][1], 2);
    EXPECT_EQ(counts[4][1], 1);
    EXPECT_EQ(counts[4][3], 1);
    EXPECT_EQ(counts[5][3], 0);
}

TEST(StateOccupancyCollector, FailedReplicatesAreNotCounted) {
    StateOccupancyCollector c(GRAPH, {0, 1});
    c.reset({0, 0, 1, 0}, {});
    c.registerEvent({0, 1, 0.0, 0.5, false});
    c.save(TrajectoryResult::FAILED);
    EXPECT_TRUE(c.counts().empty());
}

TEST(StateOccupancyCollector, Merge) {
    StateOccupancyCollector a(GRAPH, {0, 1});
    StateOccupancyCollector b(GRAPH, {0, 1});
    feed(a, {0, 0, 1, 0}, {}, {{0, 2, 0.0, 0.5, true}}, TrajectoryResult::ABSORBED);
    feed(b, {0, 0, 2, 0}, {}, {{0, 0, 0.0, 1.0, true}}, TrajectoryResult::CAPPED_AT_HORIZON);
    feed(b, {0, 1, 2, 0}, {}, {{0, 0, 0.0, 1.0, true}}, TrajectoryResult::CAPPED_AT_HORIZON);
    a.merge(b);
    const auto& counts = a.counts().at({0, 0});
    EXPECT_EQ(counts[0][0], 2);
    EXPECT_EQ(counts[1][0], 1);
    EXPECT_EQ(counts[1][2], 1);
    EXPECT_EQ(a.counts().count({0, 1}), 1u);
}

TEST(EventHistoryCollector, KeepsCompletedHistoriesInKeyOrder) {
    EventHistoryCollector a, b;
    feed(a, {1, 0, 1, 0}, {}, {{0, 2, 0.0, 1.0, true}}, TrajectoryResult::ABSORBED);
    feed(a, {0, 0, 2, 0}, {}, {{0, 1, 0.0, 0.5, false}}, TrajectoryResult::FAILED);
    feed(b, {0, 0, 1, 0}, {}, {{0, 1, 0.0, 0.5, false}, {1, 2, 0.5, 2.0, true}}, TrajectoryResult::ABSORBED);
    a.merge(b);
    a.finalize();

    const auto& rows = a.rows();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].key.sample, 0);
    EXPECT_EQ(rows[0].record.to, 1);
    EXPECT_EQ(rows[1].key.sample, 0);
    EXPECT_EQ(rows[1].record.timeStart, 0.5);
    EXPECT_EQ(rows[2].key.sample, 1);
}

TEST(OutcomeCollector, SumsPerCellAndCountsMissing) {
    OutcomeCollector c(careValues());
    const std::vector<EventRecord> history = {{0, 1, 0.0, 1.0, false}, {1, 2, 1.0, 3.0, true}};
    feed(c, {0, 0, 1, 0}, {2.0}, history, TrajectoryResult::ABSORBED);
    feed(c, {0, 0, 2, 0}, {3.0}, history, TrajectoryResult::ABSORBED);
    feed(c, {0, 0, 3, 0}, {3.0}, {}, TrajectoryResult::FAILED);
    feed(c, {0, 0, 4, 1}, {1.0}, history, TrajectoryResult::ABSORBED);

    const auto& cell = c.cells().at(CellKey{0, 0, 0});
    EXPECT_EQ(cell.count, 2);
    EXPECT_EQ(cell.missing, 1);
    // price * 1 year in Healthy + 10 * price * 2 years in Sick
    EXPECT_DOUBLE_EQ(cell.sums[0][0], 21.0 * 2.0 + 21.0 * 3.0);
    EXPECT_DOUBLE_EQ(cell.sums[0][c.values().totalCostColumn()], 105.0);
    EXPECT_DOUBLE_EQ(cell.sums[0][c.values().lifeYearColumn()], 6.0);
    EXPECT_EQ(c.cells().at(CellKey{0, 0, 1}).count, 1);

    OutcomeCollector other(careValues());
    feed(other, {0, 0, 5, 0}, {1.0}, history, TrajectoryResult::ABSORBED);
    c.merge(other);
    EXPECT_EQ(c.cells().at(CellKey{0, 0, 0}).count, 3);
    EXPECT_DOUBLE_EQ(c.cells().at(CellKey{0, 0, 0}).sums[0][0], 126.0);
}

TEST(DataCollectorGroup, CopiesAreIndependent) {
    const DataCollectorGroup group({std::make_shared<EventHistoryCollector>(),
                                    std::make_shared<OutcomeCollector>(careValues())});
    DataCollectorGroup copy(group);
    feed(copy, {0, 0, 1, 0}, {1.0}, {{0, 2, 0.0, 1.0, true}}, TrajectoryResult::ABSORBED);

    ASSERT_EQ(copy.size(), 2u);
    EXPECT_EQ(copy.find<EventHistoryCollector>()->rows().size(), 1u);
    EXPECT_TRUE(group.find<EventHistoryCollector>()->rows().empty());
    EXPECT_EQ(group.find<StateOccupancyCollector>(), nullptr);

    DataCollectorGroup merged(group);
    merged.merge(copy);
    merged.finalize();
    EXPECT_EQ(merged.find<OutcomeCollector>()->cells().at(CellKey{0, 0, 0}).count, 1);
}
