// OutputWriter_test.cpp
#include "gtest/gtest.h"
#include "OutputWriter.h"
#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

using namespace ipsim;

namespace {
    const std::vector<std::string> STATES = {"Healthy", "Sick", "Dead"};
    const std::vector<std::string> COLUMNS = {"drug", "total_cost", "qalys", "life_years"};

    const InputData INPUT({"treat"}, {{0, "soc", {0.0}}, {1, "new", {1.0}}}, {"age"}, {{7, 0, {60.0}}});

    OutputWriter writer() {
        return OutputWriter(INPUT, STATES, COLUMNS, {0.0, 0.25});
    }

    std::vector<std::string> lines(const std::ostringstream& os) {
        std::istringstream in(os.str());
        std::vector<std::string> out;
        for (std::string line; std::getline(in, line);) out.push_back(line);
        return out;
    }

    long fields(const std::string& line) {
        return std::count(line.begin(), line.end(), ',') + 1;
    }
}

TEST(OutputWriter, Events) {
    std::ostringstream os;
    writer().writeEvents(os, {{{0, 1, 7, 0}, {0, 1, 0.0, 2.5, false}}, {{0, 1, 7, 0}, {1, 2, 2.5, 4.0, true}}});
    EXPECT_EQ(lines(os), (std::vector<std::string>{
                             "sample,strategy,patient,from,to,time_start,time_stop,is_final",
                             "0,new,7,Healthy,Sick,0,2.5,0",
                             "0,new,7,Sick,Dead,2.5,4,1",
                         }));
}

TEST(OutputWriter, OutcomesHaveOneRowPerRate) {
    std::ostringstream os;
    writer().writeOutcomes(os, {
                                   {3, 0, ALL_GROUPS, 4, 1, {{1.0, 2.0, 3.0, 4.0}, {0.5, 1.0, 1.5, 2.0}}},
                                   {3, 1, 1, 2, 0, {{10.0, 20.0, 0.75, 1.0}, {5.0, 10.0, 0.5, 0.5}}},
                               });
    EXPECT_EQ(lines(os), (std::vector<std::string>{
                             "sample,strategy,group,discount,count,missing,drug,total_cost,qalys,life_years",
                             "3,soc,all,0,4,1,1,2,3,4",
                             "3,soc,all,0.25,4,1,0.5,1,1.5,2",
                             "3,new,1,0,2,0,10,20,0.75,1",
                             "3,new,1,0.25,2,0,5,10,0.5,0.5",
                         }));
}

TEST(OutputWriter, Summaries) {
    std::ostringstream os;
    const std::vector<Statistic> columns = {
        {2, 1.5, 0.5, 1.0, 2.0}, {2, 3.0, 1.0, 2.0, 4.0}, {2, 0.75, 0.25, 0.5, 1.0}, {2, 1.0, 0.0, 1.0, 1.0}};
    writer().writeSummaries(os, {{1, ALL_GROUPS, 1, columns}});
    const auto out = lines(os);
    ASSERT_EQ(out.size(), 5u);
    EXPECT_EQ(out[0], "strategy,group,discount,outcome,n,mean,sd,lower,upper");
    EXPECT_EQ(out[1], "new,all,0.25,drug,2,1.5,0.5,1,2");
    EXPECT_EQ(out[3], "new,all,0.25,qalys,2,0.75,0.25,0.5,1");
    EXPECT_EQ(out[4], "new,all,0.25,life_years,2,1,0,1,1");
}

TEST(OutputWriter, IncrementalRows) {
    IncrementalResult r{1, 0, 0, {4, 2500.0, 1000.0, 1000.0, 4000.0}, {4, 0.25, 0.125, 0.125, 0.5}, 10000.0,
                        {{4, -2500.0, 1000.0, -4000.0, -1000.0}, {4, 2500.0, 1500.0, 0.0, 6000.0}}};
    std::ostringstream os;
    writer().writeIncremental(os, {r}, {0.0, 20000.0});
    const auto out = lines(os);
    EXPECT_EQ(out, (std::vector<std::string>{
                       "strategy,group,discount,measure,wtp,n,mean,sd,lower,upper",
                       "new,0,0,cost,,4,2500,1000,1000,4000",
                       "new,0,0,qalys,,4,0.25,0.125,0.125,0.5",
                       "new,0,0,icer,,4,10000,,,",
                       "new,0,0,inmb,0,4,-2500,1000,-4000,-1000",
                       "new,0,0,inmb,20000,4,2500,1500,0,6000",
                   }));
    for (const auto& line : out) EXPECT_EQ(fields(line), 10) << line;
}

TEST(OutputWriter, Acceptability) {
    std::ostringstream os;
    writer().writeAcceptability(os, {{ALL_GROUPS, 1, 20000.0, 0, 0.25}, {ALL_GROUPS, 1, 20000.0, 1, 0.75}});
    EXPECT_EQ(lines(os), (std::vector<std::string>{
                             "group,discount,wtp,strategy,probability",
                             "all,0.25,20000,soc,0.25",
                             "all,0.25,20000,new,0.75",
                         }));
}

TEST(OutputWriter, OccupancyProbabilities) {
    const auto graph = std::make_shared<const StateGraph>(STATES, std::vector<Edge>{{0, 1}, {0, 2}, {1, 2}}, 0);
    StateOccupancyCollector occupancy(graph, {0.0, 1.0, 2.0});
    occupancy.reset({0, 0, 1, 0}, {});
    occupancy.registerEvent({0, 1, 0.0, 0.5, false});
    occupancy.registerEvent({1, 2, 0.5, 1.5, true});
    occupancy.save(TrajectoryResult::ABSORBED);
    occupancy.reset({0, 0, 2, 0}, {});
    occupancy.registerEvent({0, 0, 0.0, 1.5, true});
    occupancy.save(TrajectoryResult::CAPPED_AT_HORIZON);

    std::ostringstream os;
    writer().writeOccupancy(os, occupancy);
    EXPECT_EQ(lines(os), (std::vector<std::string>{
                             "sample,strategy,time,Healthy,Sick,Dead,n",
                             "0,soc,0,1,0,0,2",
                             "0,soc,1,0.5,0.5,0,2",
                             "0,soc,2,0,0,1,1",
                         }));
}

TEST(OutputWriter, FailureMessagesAreQuoted) {
    std::ostringstream os;
    writer().writeFailures(os, {{{1, 0, 9, 0}, "transition A->B: sampled \"x\", then gave up"}});
    EXPECT_EQ(lines(os), (std::vector<std::string>{
                             "sample,strategy,patient,message",
                             "1,soc,9,\"transition A->B: sampled \"\"x\"\", then gave up\"",
                         }));
}
