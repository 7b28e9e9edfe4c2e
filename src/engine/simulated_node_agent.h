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

// Node agent that runs no real workload. Instances are bookkept in memory and
// their lifecycle is driven either automatically or by explicit calls, which
// makes it the agent of choice for tests and the simulation driver.

#ifndef MEADOW_ENGINE_SIMULATED_NODE_AGENT_H
#define MEADOW_ENGINE_SIMULATED_NODE_AGENT_H

#include <map>
#include <set>
#include <string>
#include <vector>

#include <boost/thread/mutex.hpp>

#include "base/common.h"
#include "engine/node_agent_interface.h"

namespace meadow {
namespace agent {

class SimulatedNodeAgent : public NodeAgentInterface {
 public:
  SimulatedNodeAgent();
  void Launch(const NodeID_t& node_id,
              InstanceID_t instance_id,
              const LaunchCommand& command,
              const ResourceVector& resource_request,
              AgentResultCallback done);
  void Kill(const NodeID_t& node_id,
            InstanceID_t instance_id,
            AgentResultCallback done);

  // If set (the default), launches report STARTED immediately. Otherwise they
  // stay outstanding until StartInstance() or FailLaunch() is called.
  void set_auto_start(bool auto_start);
  // If set (the default), kills report KILLED immediately. Otherwise they
  // stay outstanding until CompleteKill() is called.
  void set_auto_kill(bool auto_kill);
  // Launches and kills on an unreachable node fail with AGENT_UNREACHABLE and
  // KILL_FAILED respectively.
  void SetNodeReachable(const NodeID_t& node_id, bool reachable);
  // The next n launches fail with the given result type.
  void FailNextLaunches(uint64_t n, AgentResult::ResultType type);

  bool StartInstance(InstanceID_t instance_id);
  bool FailLaunch(InstanceID_t instance_id, AgentResult::ResultType type);
  bool ExitInstance(InstanceID_t instance_id, bool success);
  bool CrashInstance(InstanceID_t instance_id);
  bool CompleteKill(InstanceID_t instance_id, bool success);

  uint64_t num_launches() const;
  uint64_t num_kills() const;
  bool IsKnown(InstanceID_t instance_id) const;
  bool IsStarted(InstanceID_t instance_id) const;
  NodeID_t NodeForInstance(InstanceID_t instance_id) const;
  vector<InstanceID_t> InstancesOnNode(const NodeID_t& node_id) const;
  vector<InstanceID_t> OutstandingKills() const;
  uint64_t NumInstances() const;
  bool LaunchCommandFor(InstanceID_t instance_id,
                        LaunchCommand* command) const;

  string Describe() const;

 private:
  struct SimulatedInstance {
    SimulatedInstance() : started(false) {}
    NodeID_t node_id;
    LaunchCommand command;
    AgentResultCallback done;
    bool started;
  };

  bool ReportAndForget(InstanceID_t instance_id, const AgentResult& result);

  mutable boost::mutex lock_;
  map<InstanceID_t, SimulatedInstance> instances_;
  map<InstanceID_t, AgentResultCallback> outstanding_kills_;
  set<NodeID_t> unreachable_nodes_;
  bool auto_start_;
  bool auto_kill_;
  uint64_t launches_to_fail_;
  AgentResult::ResultType launch_failure_type_;
  uint64_t num_launches_;
  uint64_t num_kills_;
};

}  // namespace agent
}  // namespace meadow

#endif  // MEADOW_ENGINE_SIMULATED_NODE_AGENT_H
