/*
 * Meadow
 * Copyright (c) The Meadow Authors.
 * All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * THIS CODE IS PROVIDED ON AN *AS IS* BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT
 * LIMITATION ANY IMPLIED WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR
 * A PARTICULAR PURPOSE, MERCHANTABLITY OR NON-INFRINGEMENT.
 *
 * See the Apache Version 2.0 License for specific language governing
 * permissions and limitations under the License.
 */

// SimulatedNodeAgent class unit tests.

#include <vector>

#include <boost/bind.hpp>
#include <gtest/gtest.h>

#include "base/common.h"
#include "engine/simulated_node_agent.h"

namespace meadow {
namespace agent {

class SimulatedNodeAgentTest : public ::testing::Test {
 protected:
  void Record(const AgentResult& result) {
    results_.push_back(result.type);
  }

  AgentResultCallback Recorder() {
    return boost::bind(&SimulatedNodeAgentTest::Record, this, _1);
  }

  void Launch(const NodeID_t& node_id, InstanceID_t instance_id) {
    LaunchCommand command;
    command.component_name = "actor";
    command.command = "run " + to_string(instance_id);
    agent_.Launch(node_id, instance_id, command, ResourceVector(1, 512, 0),
                  Recorder());
  }

  SimulatedNodeAgent agent_;
  vector<AgentResult::ResultType> results_;
};

TEST_F(SimulatedNodeAgentTest, LaunchStartsAndExits) {
  Launch("node-a", 1);
  ASSERT_EQ(results_.size(), 1U);
  EXPECT_EQ(results_[0], AgentResult::STARTED);
  EXPECT_TRUE(agent_.IsStarted(1));
  EXPECT_EQ(agent_.NodeForInstance(1), "node-a");
  LaunchCommand command;
  ASSERT_TRUE(agent_.LaunchCommandFor(1, &command));
  EXPECT_EQ(command.command, "run 1");
  EXPECT_TRUE(agent_.ExitInstance(1, false));
  ASSERT_EQ(results_.size(), 2U);
  EXPECT_EQ(results_[1], AgentResult::EXITED_ERROR);
  EXPECT_FALSE(agent_.IsKnown(1));
  // Exactly one exit per instance.
  EXPECT_FALSE(agent_.ExitInstance(1, true));
  EXPECT_FALSE(agent_.CrashInstance(1));
}

TEST_F(SimulatedNodeAgentTest, Describe) {
  Launch("node-a", 1);
  agent_.SetNodeReachable("node-b", false);
  EXPECT_EQ(to_string(agent_),
            "<simulated node agent, 1 instances, 1 unreachable nodes>");
}

TEST_F(SimulatedNodeAgentTest, ManualStart) {
  agent_.set_auto_start(false);
  Launch("node-a", 1);
  Launch("node-a", 2);
  EXPECT_TRUE(results_.empty());
  EXPECT_EQ(agent_.InstancesOnNode("node-a").size(), 2U);
  EXPECT_TRUE(agent_.StartInstance(1));
  EXPECT_FALSE(agent_.StartInstance(1));
  EXPECT_FALSE(agent_.FailLaunch(1, AgentResult::LAUNCH_FAILED));
  EXPECT_TRUE(agent_.FailLaunch(2, AgentResult::LAUNCH_FAILED));
  ASSERT_EQ(results_.size(), 2U);
  EXPECT_EQ(results_[0], AgentResult::STARTED);
  EXPECT_EQ(results_[1], AgentResult::LAUNCH_FAILED);
  EXPECT_EQ(agent_.NumInstances(), 1U);
}

TEST_F(SimulatedNodeAgentTest, InjectedLaunchFailures) {
  agent_.FailNextLaunches(2, AgentResult::LAUNCH_FAILED);
  Launch("node-a", 1);
  Launch("node-a", 2);
  Launch("node-a", 3);
  ASSERT_EQ(results_.size(), 3U);
  EXPECT_EQ(results_[0], AgentResult::LAUNCH_FAILED);
  EXPECT_EQ(results_[1], AgentResult::LAUNCH_FAILED);
  EXPECT_EQ(results_[2], AgentResult::STARTED);
  EXPECT_EQ(agent_.num_launches(), 3ULL);
}

TEST_F(SimulatedNodeAgentTest, UnreachableNode) {
  Launch("node-a", 1);
  agent_.SetNodeReachable("node-a", false);
  Launch("node-a", 2);
  agent_.Kill("node-a", 1, Recorder());
  ASSERT_EQ(results_.size(), 3U);
  EXPECT_EQ(results_[1], AgentResult::AGENT_UNREACHABLE);
  EXPECT_EQ(results_[2], AgentResult::KILL_FAILED);
  agent_.SetNodeReachable("node-a", true);
  agent_.Kill("node-a", 1, Recorder());
  EXPECT_EQ(results_.back(), AgentResult::KILLED);
  EXPECT_FALSE(agent_.IsKnown(1));
}

TEST_F(SimulatedNodeAgentTest, OutstandingKills) {
  agent_.set_auto_kill(false);
  Launch("node-a", 1);
  agent_.Kill("node-a", 1, Recorder());
  EXPECT_EQ(agent_.OutstandingKills().size(), 1U);
  EXPECT_TRUE(agent_.CompleteKill(1, false));
  EXPECT_EQ(results_.back(), AgentResult::KILL_FAILED);
  EXPECT_TRUE(agent_.IsKnown(1));
  agent_.Kill("node-a", 1, Recorder());
  EXPECT_TRUE(agent_.CompleteKill(1, true));
  EXPECT_EQ(results_.back(), AgentResult::KILLED);
  EXPECT_FALSE(agent_.IsKnown(1));
  EXPECT_FALSE(agent_.CompleteKill(1, true));
  EXPECT_EQ(agent_.num_kills(), 2ULL);
}

}  // namespace agent
}  // namespace meadow

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
