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

// ScheduleSpec class unit tests.

#include <gtest/gtest.h>

#include "base/common.h"
#include "base/schedule_desc.pb.h"
#include "base/schedule_spec.h"

namespace meadow {

class ScheduleSpecTest : public ::testing::Test {
 protected:
  virtual void SetUp() {
    sd_.set_name("MyScheduleName");
    sd_.set_allocation_mode(ScheduleDescriptor::SINGLE_METRIC_COMPACTED);
    sd_.set_metric(ScheduleDescriptor::MEMORY);
    sd_.add_job_names("MyJobName2");
    sd_.add_job_names("MyJobName3");
    AddComponent("actor", 2, "4096m", 5);
    AddComponent("learner", 4, "8192m", 1);
    AddComponent("evaluator", 1, "1g", 2);
  }

  ComponentDescriptor* AddComponent(const string& name, uint64_t cpu,
                                    const string& memory, uint64_t num) {
    ComponentDescriptor* cd = sd_.add_components();
    cd->set_name(name);
    cd->set_image("MyImageName");
    cd->mutable_resources()->set_cpu_cores(cpu);
    cd->set_memory(memory);
    cd->set_num(num);
    cd->set_mount_target("/mnt/data");
    cd->set_command("python /mnt/data/run_" + name + ".py");
    return cd;
  }

  void Restrict(const string& job_name, const vector<string>& components) {
    JobComponentsDescriptor* jcd = sd_.add_job_components();
    jcd->set_job_name(job_name);
    for (const string& component : components)
      jcd->add_components(component);
  }

  static bool Rejected(const ScheduleDescriptor& sd, string* error) {
    return ScheduleSpec::FromDescriptor(sd, error).get() == NULL;
  }

  ScheduleDescriptor sd_;
};

TEST_F(ScheduleSpecTest, FromDescriptor) {
  string error;
  shared_ptr<const ScheduleSpec> spec = ScheduleSpec::FromDescriptor(sd_,
                                                                     &error);
  ASSERT_TRUE(spec.get() != NULL) << error;
  EXPECT_EQ(spec->name(), "MyScheduleName");
  EXPECT_EQ(spec->allocation_mode(),
            ScheduleDescriptor::SINGLE_METRIC_COMPACTED);
  EXPECT_EQ(spec->metric(), ScheduleDescriptor::MEMORY);
  ASSERT_EQ(spec->job_names().size(), 2U);
  EXPECT_EQ(spec->job_names()[0], "MyJobName2");
  EXPECT_EQ(spec->components().size(), 3U);
  const ComponentSpec* actor = spec->FindComponent("actor");
  ASSERT_TRUE(actor != NULL);
  EXPECT_EQ(actor->resource_request, ResourceVector(2, 4096, 0));
  EXPECT_EQ(actor->replica_count, 5ULL);
  EXPECT_EQ(actor->mount_target, "/mnt/data");
  EXPECT_EQ(actor->launch_command_template, "python /mnt/data/run_actor.py");
  EXPECT_EQ(spec->FindComponent("evaluator")->resource_request.memory_mb(),
            1024ULL);
  EXPECT_TRUE(spec->FindComponent("critic") == NULL);
}

// Without a memory string, the numeric memory field is used.
TEST_F(ScheduleSpecTest, NumericMemory) {
  ComponentDescriptor* cd = AddComponent("critic", 1, "", 1);
  cd->mutable_resources()->set_memory_mb(300);
  string error;
  shared_ptr<const ScheduleSpec> spec = ScheduleSpec::FromDescriptor(sd_,
                                                                     &error);
  ASSERT_TRUE(spec.get() != NULL) << error;
  EXPECT_EQ(spec->FindComponent("critic")->resource_request.memory_mb(),
            300ULL);
}

TEST_F(ScheduleSpecTest, RejectsInvalidDescriptors) {
  string error;
  ScheduleDescriptor nameless(sd_);
  nameless.clear_name();
  EXPECT_TRUE(Rejected(nameless, &error));
  EXPECT_FALSE(error.empty());

  ScheduleDescriptor duplicate_job(sd_);
  duplicate_job.add_job_names("MyJobName2");
  EXPECT_TRUE(Rejected(duplicate_job, &error));

  ScheduleDescriptor duplicate_component(sd_);
  duplicate_component.add_components()->CopyFrom(sd_.components(0));
  EXPECT_TRUE(Rejected(duplicate_component, &error));

  ScheduleDescriptor no_replicas(sd_);
  no_replicas.mutable_components(1)->set_num(0);
  EXPECT_TRUE(Rejected(no_replicas, &error));

  ScheduleDescriptor bad_memory(sd_);
  bad_memory.mutable_components(0)->set_memory("lots");
  EXPECT_TRUE(Rejected(bad_memory, &error));
  EXPECT_NE(error.find("lots"), string::npos);

  ScheduleDescriptor unknown_member(sd_);
  JobComponentsDescriptor* jcd = unknown_member.add_job_components();
  jcd->set_job_name("MyJobName2");
  jcd->add_components("critic");
  EXPECT_TRUE(Rejected(unknown_member, &error));

  ScheduleDescriptor unknown_mode(sd_);
  unknown_mode.set_allocation_mode(
      static_cast<ScheduleDescriptor::AllocationMode>(7));
  EXPECT_TRUE(Rejected(unknown_mode, &error));
}

// Jobs without explicit membership run every component.
TEST_F(ScheduleSpecTest, AllComponentsActiveByDefault) {
  string error;
  shared_ptr<const ScheduleSpec> spec = ScheduleSpec::FromDescriptor(sd_,
                                                                     &error);
  ASSERT_TRUE(spec.get() != NULL) << error;
  EXPECT_EQ(spec->ActiveComponents().size(), 3U);
  ReplicaCountMap_t desired = spec->DesiredReplicaCounts();
  EXPECT_EQ(desired["actor"], 5ULL);
  EXPECT_EQ(desired["learner"], 1ULL);
  EXPECT_EQ(desired["evaluator"], 2ULL);
}

// Components that no job reaches are inactive and desire no replicas.
TEST_F(ScheduleSpecTest, JobMembershipSelectsComponents) {
  Restrict("MyJobName2", {"actor"});
  Restrict("MyJobName3", {"learner"});
  string error;
  shared_ptr<const ScheduleSpec> spec = ScheduleSpec::FromDescriptor(sd_,
                                                                     &error);
  ASSERT_TRUE(spec.get() != NULL) << error;
  set<string> active = spec->ActiveComponents();
  EXPECT_EQ(active.size(), 2U);
  EXPECT_EQ(active.count("evaluator"), 0U);
  ReplicaCountMap_t desired = spec->DesiredReplicaCounts();
  EXPECT_EQ(desired.size(), 3U);
  EXPECT_EQ(desired["actor"], 5ULL);
  EXPECT_EQ(desired["learner"], 1ULL);
  EXPECT_EQ(desired["evaluator"], 0ULL);
}

TEST_F(ScheduleSpecTest, NoJobsMeansNothingActive) {
  sd_.clear_job_names();
  string error;
  shared_ptr<const ScheduleSpec> spec = ScheduleSpec::FromDescriptor(sd_,
                                                                     &error);
  ASSERT_TRUE(spec.get() != NULL) << error;
  EXPECT_TRUE(spec->ActiveComponents().empty());
  EXPECT_EQ(spec->DesiredReplicaCounts()["actor"], 0ULL);
}

}  // namespace meadow

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
