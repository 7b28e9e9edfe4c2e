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

// ScheduleController class unit tests. These run real control loop threads
// against the wall clock, so they poll for the expected state.

#include <boost/function.hpp>
#include <boost/thread/thread.hpp>
#include <gtest/gtest.h>

#include "base/common.h"
#include "base/schedule_desc.pb.h"
#include "base/schedule_spec.h"
#include "engine/simulated_node_agent.h"
#include "misc/time_sources.h"
#include "scheduling/node_catalog.h"
#include "scheduling/schedule_controller.h"

DECLARE_uint64(control_loop_tick_ms);

namespace meadow {
namespace scheduler {

using agent::SimulatedNodeAgent;

class ScheduleControllerTest : public ::testing::Test {
 protected:
  ScheduleControllerTest() : catalog_(new NodeCatalog()) {
    FLAGS_control_loop_tick_ms = 10;
    catalog_->UpsertNode("node-a", ResourceVector(16, 32768, 0));
    catalog_->UpsertNode("node-b", ResourceVector(16, 32768, 0));
    controller_.reset(new ScheduleController(catalog_, &agent_, NULL,
                                             &time_));
  }

  virtual ~ScheduleControllerTest() {
    // Loops must stop before the agent they call into goes away.
    controller_->Shutdown();
  }

  static shared_ptr<const ScheduleSpec> MakeSpec(const string& name,
                                                 uint64_t actors) {
    ScheduleDescriptor sd;
    sd.set_name(name);
    sd.set_allocation_mode(ScheduleDescriptor::SINGLE_METRIC_COMPACTED);
    sd.set_metric(ScheduleDescriptor::CPU);
    sd.add_job_names("job");
    ComponentDescriptor* actor = sd.add_components();
    actor->set_name("actor");
    actor->set_image("trainer");
    actor->mutable_resources()->set_cpu_cores(2);
    actor->set_memory("1g");
    actor->set_num(actors);
    string error;
    shared_ptr<const ScheduleSpec> spec =
      ScheduleSpec::FromDescriptor(sd, &error);
    EXPECT_TRUE(spec.get() != NULL) << error;
    return spec;
  }

  // Polls until the condition holds or five seconds have passed.
  static bool Eventually(boost::function<bool()> condition) {
    for (int i = 0; i < 500; ++i) {
      if (condition())
        return true;
      boost::this_thread::sleep(boost::posix_time::milliseconds(10));
    }
    return condition();
  }

  bool Running(const string& schedule_name, uint64_t actors) {
    ScheduleStatus status;
    return controller_->GetScheduleStatus(schedule_name, &status) &&
        status.components["actor"].running == actors &&
        status.live_instances == actors;
  }

  bool CatalogEmpty() {
    for (const NodeState& node : catalog_->Snapshot()) {
      if (!node.allocated.IsZero())
        return false;
    }
    return true;
  }

  shared_ptr<NodeCatalog> catalog_;
  SimulatedNodeAgent agent_;
  WallTime time_;
  unique_ptr<ScheduleController> controller_;
};

TEST_F(ScheduleControllerTest, RunsScheduleToCompletion) {
  string error;
  ASSERT_TRUE(controller_->ActivateSchedule(MakeSpec("s1", 3), &error))
    << error;
  ASSERT_TRUE(Eventually([this]() { return Running("s1", 3); }));
  for (InstanceID_t instance_id : agent_.InstancesOnNode("node-a"))
    ASSERT_TRUE(agent_.ExitInstance(instance_id, true));
  ScheduleStatus status;
  ASSERT_TRUE(controller_->WaitForSchedule("s1", 5000, &status));
  EXPECT_EQ(status.state, SCHEDULE_COMPLETED);
  EXPECT_EQ(status.components["actor"].completed, 3ULL);
  EXPECT_TRUE(CatalogEmpty());
  EXPECT_TRUE(controller_->AllFinished());
}

// A finished schedule's loop thread exits and the controller drops it, but
// the final status stays available.
TEST_F(ScheduleControllerTest, FinishedSchedulesReleaseTheirLoops) {
  string error;
  ASSERT_TRUE(controller_->ActivateSchedule(MakeSpec("s1", 2), &error));
  ASSERT_TRUE(controller_->ActivateSchedule(MakeSpec("s2", 1), &error));
  ASSERT_TRUE(Eventually([this]() {
    return Running("s1", 2) && Running("s2", 1);
  }));
  EXPECT_EQ(controller_->NumRunningLoops(), 2U);
  ASSERT_TRUE(controller_->CancelSchedule("s1"));
  ScheduleStatus status;
  ASSERT_TRUE(controller_->WaitForSchedule("s1", 5000, &status));
  EXPECT_TRUE(status.finished);
  EXPECT_EQ(controller_->NumRunningLoops(), 1U);
  // The next request reaps the retired loop.
  controller_->HandleNodeEvent("node-b", NODE_EVENT_READY);
  EXPECT_EQ(controller_->NumRunningLoops(), 1U);
  ASSERT_TRUE(controller_->GetScheduleStatus("s1", &status));
  EXPECT_EQ(status.state, SCHEDULE_COMPLETED);
  EXPECT_TRUE(status.cancel_requested);
  EXPECT_TRUE(controller_->WaitForSchedule("s1", 0, NULL));
  EXPECT_TRUE(controller_->CancelSchedule("s1"));
  EXPECT_EQ(controller_->ListSchedules().size(), 2U);
  string update_error;
  EXPECT_FALSE(controller_->UpdateSchedule(MakeSpec("s1", 3), &update_error));
  EXPECT_NE(update_error.find("no longer running"), string::npos);
  for (InstanceID_t instance_id : agent_.InstancesOnNode("node-a"))
    agent_.ExitInstance(instance_id, true);
  for (InstanceID_t instance_id : agent_.InstancesOnNode("node-b"))
    agent_.ExitInstance(instance_id, true);
  ASSERT_TRUE(controller_->WaitForSchedule("s2", 5000, &status));
  EXPECT_EQ(status.state, SCHEDULE_COMPLETED);
  EXPECT_EQ(controller_->NumRunningLoops(), 0U);
  EXPECT_TRUE(controller_->AllFinished());
}

TEST_F(ScheduleControllerTest, ActivationOfActiveScheduleRejected) {
  string error;
  ASSERT_TRUE(controller_->ActivateSchedule(MakeSpec("s1", 1), &error));
  EXPECT_FALSE(controller_->ActivateSchedule(MakeSpec("s1", 2), &error));
  EXPECT_NE(error.find("already active"), string::npos);
  ASSERT_TRUE(controller_->CancelSchedule("s1"));
  ASSERT_TRUE(controller_->WaitForSchedule("s1", 5000, NULL));
  // A finished schedule may be replaced.
  EXPECT_TRUE(controller_->ActivateSchedule(MakeSpec("s1", 2), &error));
  EXPECT_TRUE(Eventually([this]() { return Running("s1", 2); }));
  EXPECT_EQ(controller_->ListSchedules().size(), 1U);
}

TEST_F(ScheduleControllerTest, CancelDrainsSchedule) {
  string error;
  ASSERT_TRUE(controller_->ActivateSchedule(MakeSpec("s1", 4), &error));
  ASSERT_TRUE(Eventually([this]() { return Running("s1", 4); }));
  EXPECT_TRUE(controller_->CancelSchedule("s1"));
  EXPECT_TRUE(controller_->CancelSchedule("s1"));
  EXPECT_FALSE(controller_->CancelSchedule("unknown"));
  ScheduleStatus status;
  ASSERT_TRUE(controller_->WaitForSchedule("s1", 5000, &status));
  EXPECT_EQ(status.state, SCHEDULE_COMPLETED);
  EXPECT_TRUE(status.cancel_requested);
  EXPECT_EQ(status.live_instances, 0ULL);
  EXPECT_EQ(agent_.num_kills(), 4ULL);
  EXPECT_TRUE(CatalogEmpty());
}

TEST_F(ScheduleControllerTest, UpdateSchedule) {
  string error;
  EXPECT_FALSE(controller_->UpdateSchedule(MakeSpec("s1", 2), &error));
  ASSERT_TRUE(controller_->ActivateSchedule(MakeSpec("s1", 1), &error));
  ASSERT_TRUE(Eventually([this]() { return Running("s1", 1); }));
  ASSERT_TRUE(controller_->UpdateSchedule(MakeSpec("s1", 3), &error))
    << error;
  EXPECT_TRUE(Eventually([this]() { return Running("s1", 3); }));
}

// Node events reach every schedule.
TEST_F(ScheduleControllerTest, NodeEventsFanOut) {
  string error;
  ASSERT_TRUE(controller_->ActivateSchedule(MakeSpec("s1", 2), &error));
  ASSERT_TRUE(controller_->ActivateSchedule(MakeSpec("s2", 2), &error));
  ASSERT_TRUE(Eventually([this]() {
    return Running("s1", 2) && Running("s2", 2);
  }));
  ASSERT_EQ(agent_.InstancesOnNode("node-a").size(), 4U);
  ASSERT_EQ(catalog_->MarkUnreachable("node-a"), CATALOG_OK);
  controller_->HandleNodeEvent("node-a", NODE_EVENT_UNREACHABLE);
  EXPECT_TRUE(Eventually([this]() {
    return agent_.InstancesOnNode("node-b").size() == 4 &&
        Running("s1", 2) && Running("s2", 2);
  }));
  NodeState node;
  ASSERT_TRUE(catalog_->GetNode("node-a", &node));
  EXPECT_TRUE(node.allocated.IsZero());
}

TEST_F(ScheduleControllerTest, ListAndCancelAll) {
  string error;
  ASSERT_TRUE(controller_->ActivateSchedule(MakeSpec("s2", 1), &error));
  ASSERT_TRUE(controller_->ActivateSchedule(MakeSpec("s1", 1), &error));
  vector<ScheduleStatus> schedules = controller_->ListSchedules();
  ASSERT_EQ(schedules.size(), 2U);
  EXPECT_EQ(schedules[0].schedule_name, "s1");
  EXPECT_EQ(schedules[1].schedule_name, "s2");
  EXPECT_FALSE(controller_->AllFinished());
  controller_->CancelAll();
  EXPECT_TRUE(controller_->WaitForSchedule("s1", 5000, NULL));
  EXPECT_TRUE(controller_->WaitForSchedule("s2", 5000, NULL));
  EXPECT_TRUE(controller_->AllFinished());
  EXPECT_TRUE(CatalogEmpty());
  controller_->Shutdown();
  EXPECT_TRUE(controller_->ListSchedules().empty());
  ScheduleStatus status;
  EXPECT_FALSE(controller_->GetScheduleStatus("s1", &status));
}

}  // namespace scheduler
}  // namespace meadow

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
