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

#include "engine/simulated_node_agent.h"

#include <map>
#include <string>
#include <vector>

namespace meadow {
namespace agent {

SimulatedNodeAgent::SimulatedNodeAgent()
  : auto_start_(true), auto_kill_(true), launches_to_fail_(0),
    launch_failure_type_(AgentResult::LAUNCH_FAILED), num_launches_(0),
    num_kills_(0) {
  VLOG(1) << "SimulatedNodeAgent initiated.";
}

void SimulatedNodeAgent::Launch(const NodeID_t& node_id,
                                InstanceID_t instance_id,
                                const LaunchCommand& command,
                                const ResourceVector& resource_request,
                                AgentResultCallback done) {
  AgentResult result;
  bool report = false;
  {
    boost::lock_guard<boost::mutex> lock(lock_);
    num_launches_++;
    VLOG(2) << "Simulating launch of instance " << instance_id << " ("
            << command.component_name << ", " << resource_request
            << ") on node " << node_id;
    if (unreachable_nodes_.count(node_id)) {
      result = AgentResult(AgentResult::AGENT_UNREACHABLE,
                           "node " + node_id + " is unreachable");
      report = true;
    } else if (launches_to_fail_ > 0) {
      launches_to_fail_--;
      result = AgentResult(launch_failure_type_, "simulated launch failure");
      report = true;
    } else {
      SimulatedInstance& instance = instances_[instance_id];
      instance.node_id = node_id;
      instance.command = command;
      instance.done = done;
      instance.started = auto_start_;
      if (auto_start_) {
        result = AgentResult(AgentResult::STARTED, "");
        report = true;
      }
    }
  }
  // Callbacks always run without holding the lock, since they may call back
  // into the agent.
  if (report)
    done(result);
}

void SimulatedNodeAgent::Kill(const NodeID_t& node_id,
                              InstanceID_t instance_id,
                              AgentResultCallback done) {
  AgentResult result;
  bool report = false;
  {
    boost::lock_guard<boost::mutex> lock(lock_);
    num_kills_++;
    VLOG(2) << "Simulating kill of instance " << instance_id << " on node "
            << node_id;
    if (unreachable_nodes_.count(node_id)) {
      result = AgentResult(AgentResult::KILL_FAILED,
                           "node " + node_id + " is unreachable");
      report = true;
    } else if (auto_kill_) {
      instances_.erase(instance_id);
      result = AgentResult(AgentResult::KILLED, "");
      report = true;
    } else {
      outstanding_kills_[instance_id] = done;
    }
  }
  if (report)
    done(result);
}

void SimulatedNodeAgent::set_auto_start(bool auto_start) {
  boost::lock_guard<boost::mutex> lock(lock_);
  auto_start_ = auto_start;
}

void SimulatedNodeAgent::set_auto_kill(bool auto_kill) {
  boost::lock_guard<boost::mutex> lock(lock_);
  auto_kill_ = auto_kill;
}

void SimulatedNodeAgent::SetNodeReachable(const NodeID_t& node_id,
                                          bool reachable) {
  boost::lock_guard<boost::mutex> lock(lock_);
  if (reachable)
    unreachable_nodes_.erase(node_id);
  else
    unreachable_nodes_.insert(node_id);
}

void SimulatedNodeAgent::FailNextLaunches(uint64_t n,
                                          AgentResult::ResultType type) {
  boost::lock_guard<boost::mutex> lock(lock_);
  launches_to_fail_ = n;
  launch_failure_type_ = type;
}

bool SimulatedNodeAgent::StartInstance(InstanceID_t instance_id) {
  AgentResultCallback done;
  {
    boost::lock_guard<boost::mutex> lock(lock_);
    map<InstanceID_t, SimulatedInstance>::iterator it =
      instances_.find(instance_id);
    if (it == instances_.end() || it->second.started)
      return false;
    it->second.started = true;
    done = it->second.done;
  }
  done(AgentResult(AgentResult::STARTED, ""));
  return true;
}

bool SimulatedNodeAgent::FailLaunch(InstanceID_t instance_id,
                                    AgentResult::ResultType type) {
  {
    boost::lock_guard<boost::mutex> lock(lock_);
    map<InstanceID_t, SimulatedInstance>::const_iterator it =
      instances_.find(instance_id);
    if (it == instances_.end() || it->second.started)
      return false;
  }
  return ReportAndForget(instance_id,
                         AgentResult(type, "simulated launch failure"));
}

bool SimulatedNodeAgent::ExitInstance(InstanceID_t instance_id,
                                      bool success) {
  if (success) {
    return ReportAndForget(instance_id,
                           AgentResult(AgentResult::EXITED_OK, ""));
  }
  return ReportAndForget(instance_id,
                         AgentResult(AgentResult::EXITED_ERROR,
                                     "exited with non-zero status"));
}

bool SimulatedNodeAgent::CrashInstance(InstanceID_t instance_id) {
  return ReportAndForget(instance_id,
                         AgentResult(AgentResult::CRASHED, "simulated crash"));
}

bool SimulatedNodeAgent::CompleteKill(InstanceID_t instance_id,
                                      bool success) {
  AgentResultCallback done;
  {
    boost::lock_guard<boost::mutex> lock(lock_);
    map<InstanceID_t, AgentResultCallback>::iterator it =
      outstanding_kills_.find(instance_id);
    if (it == outstanding_kills_.end())
      return false;
    done = it->second;
    outstanding_kills_.erase(it);
    if (success)
      instances_.erase(instance_id);
  }
  if (success)
    done(AgentResult(AgentResult::KILLED, ""));
  else
    done(AgentResult(AgentResult::KILL_FAILED, "simulated kill failure"));
  return true;
}

bool SimulatedNodeAgent::ReportAndForget(InstanceID_t instance_id,
                                         const AgentResult& result) {
  AgentResultCallback done;
  {
    boost::lock_guard<boost::mutex> lock(lock_);
    map<InstanceID_t, SimulatedInstance>::iterator it =
      instances_.find(instance_id);
    if (it == instances_.end())
      return false;
    done = it->second.done;
    instances_.erase(it);
  }
  done(result);
  return true;
}

uint64_t SimulatedNodeAgent::num_launches() const {
  boost::lock_guard<boost::mutex> lock(lock_);
  return num_launches_;
}

uint64_t SimulatedNodeAgent::num_kills() const {
  boost::lock_guard<boost::mutex> lock(lock_);
  return num_kills_;
}

bool SimulatedNodeAgent::IsKnown(InstanceID_t instance_id) const {
  boost::lock_guard<boost::mutex> lock(lock_);
  return instances_.find(instance_id) != instances_.end();
}

bool SimulatedNodeAgent::IsStarted(InstanceID_t instance_id) const {
  boost::lock_guard<boost::mutex> lock(lock_);
  map<InstanceID_t, SimulatedInstance>::const_iterator it =
    instances_.find(instance_id);
  return it != instances_.end() && it->second.started;
}

NodeID_t SimulatedNodeAgent::NodeForInstance(InstanceID_t instance_id) const {
  boost::lock_guard<boost::mutex> lock(lock_);
  map<InstanceID_t, SimulatedInstance>::const_iterator it =
    instances_.find(instance_id);
  if (it == instances_.end())
    return "";
  return it->second.node_id;
}

vector<InstanceID_t> SimulatedNodeAgent::InstancesOnNode(
    const NodeID_t& node_id) const {
  boost::lock_guard<boost::mutex> lock(lock_);
  vector<InstanceID_t> ids;
  for (const auto& id_instance : instances_) {
    if (id_instance.second.node_id == node_id)
      ids.push_back(id_instance.first);
  }
  return ids;
}

vector<InstanceID_t> SimulatedNodeAgent::OutstandingKills() const {
  boost::lock_guard<boost::mutex> lock(lock_);
  vector<InstanceID_t> ids;
  for (const auto& id_kill : outstanding_kills_)
    ids.push_back(id_kill.first);
  return ids;
}

uint64_t SimulatedNodeAgent::NumInstances() const {
  boost::lock_guard<boost::mutex> lock(lock_);
  return instances_.size();
}

string SimulatedNodeAgent::Describe() const {
  boost::lock_guard<boost::mutex> lock(lock_);
  return "simulated node agent, " + to_string(instances_.size()) +
      " instances, " + to_string(unreachable_nodes_.size()) +
      " unreachable nodes";
}

bool SimulatedNodeAgent::LaunchCommandFor(InstanceID_t instance_id,
                                          LaunchCommand* command) const {
  boost::lock_guard<boost::mutex> lock(lock_);
  map<InstanceID_t, SimulatedInstance>::const_iterator it =
    instances_.find(instance_id);
  if (it == instances_.end())
    return false;
  *command = it->second.command;
  return true;
}

}  // namespace agent
}  // namespace meadow
