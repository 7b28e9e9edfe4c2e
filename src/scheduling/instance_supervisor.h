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

// The instance supervisor owns the authoritative instance map of one
// schedule. It reconciles desired replica counts against the instances it
// knows about, applies placement plans against the shared node catalog,
// talks to node agents and folds their reports back into the per-instance
// state machine:
//
//   Pending -> Launching -> Running -> Failed -> Pending | Terminated
//
// The supervisor is not thread-safe. All calls must come from the control
// loop that owns it; agent results reach it only through the report sink
// given at construction, which must hand them back to that loop rather than
// call into the supervisor directly.

#ifndef MEADOW_SCHEDULING_INSTANCE_SUPERVISOR_H
#define MEADOW_SCHEDULING_INSTANCE_SUPERVISOR_H

#include <map>
#include <set>
#include <string>
#include <vector>

#include <boost/function.hpp>

#include "base/common.h"
#include "base/errors.h"
#include "base/instance_desc.pb.h"
#include "base/schedule_spec.h"
#include "base/types.h"
#include "engine/node_agent_interface.h"
#include "misc/time_sources.h"
#include "scheduling/allocator.h"
#include "scheduling/instance_event_notifier_interface.h"
#include "scheduling/node_catalog.h"

namespace meadow {
namespace scheduler {

using agent::AgentResult;
using agent::NodeAgentInterface;

// An agent result, tagged with the placement it refers to.
struct InstanceReport {
  InstanceReport() : instance_id(0), placement_epoch(0) {}
  InstanceID_t instance_id;
  NodeID_t node_id;
  uint64_t placement_epoch;
  AgentResult result;
};

typedef boost::function<void(const InstanceReport&)> InstanceReportSink;

struct ComponentStatus {
  ComponentStatus()
    : desired(0), pending(0), launching(0), running(0), terminating(0),
      completed(0), terminated_with_error(0), failures(0) {}
  uint64_t desired;
  uint64_t pending;
  uint64_t launching;
  uint64_t running;
  // Live instances (counted above by state) that are being torn down.
  uint64_t terminating;
  // Replicas that exited successfully.
  uint64_t completed;
  // Replicas that ran out of attempts or could never be placed.
  uint64_t terminated_with_error;
  // Failed attempts so far, including those that were retried.
  uint64_t failures;
  string last_blocking_reason;

  uint64_t live() const { return pending + launching + running; }
};

typedef map<string, ComponentStatus> ComponentStatusMap;

class InstanceSupervisor {
 public:
  InstanceSupervisor(shared_ptr<const ScheduleSpec> spec,
                     shared_ptr<NodeCatalog> node_catalog,
                     NodeAgentInterface* node_agent,
                     InstanceEventNotifierInterface* event_notifier,
                     TimeInterface* time_manager,
                     InstanceReportSink report_sink);

  /**
   * Brings the instance set in line with the desired replica counts and
   * places every pending instance that is due. Shortfalls are created as
   * pending instances; overages are torn down, pending ones first, then
   * launching, then running, newest first. Placements are applied by
   * reserving capacity in the node catalog and launching through the node
   * agent. A reservation that fails because the snapshot went stale leaves
   * the instance pending for the next round.
   * Calling it again without intervening events issues no agent calls.
   * @param desired desired replica count per component
   * @param snapshot the node catalog snapshot to plan against
   */
  void Reconcile(const ReplicaCountMap_t& desired,
                 const vector<NodeState>& snapshot);

  /**
   * Evicts the instances resident on a node that became unreachable or was
   * removed. They release their capacity and go back to pending without
   * being charged an attempt; those already being torn down terminate.
   * Other node events do not affect resident instances.
   */
  void HandleNodeEvent(const NodeID_t& node_id, NodeEventType event);

  /**
   * Folds an agent report into the state machine. Reports for unknown
   * instances, or for an earlier placement of a known one, are ignored.
   */
  void HandleInstanceEvent(const InstanceReport& report);

  // Treats instances that have been launching for longer than
  // --launch_timeout_ms as failed launches. Returns how many timed out.
  uint64_t CheckLaunchTimeouts();

  ComponentStatusMap Status() const;
  // Instances that have not terminated yet.
  uint64_t NumLiveInstances() const;

  /**
   * Drops every remaining instance and returns its capacity to the node
   * catalog, without talking to the agents.
   */
  void ReleaseAll(const string& reason);

  // Switches to a new version of the schedule. Takes effect at the next
  // reconciliation.
  void UpdateSpec(shared_ptr<const ScheduleSpec> spec);

  inline const ScheduleSpec& spec() const { return *spec_; }
  // Returns false if the instance is not known.
  bool GetInstance(InstanceID_t instance_id, InstanceDescriptor* id) const;
  vector<InstanceID_t> InstancesOfComponent(const string& component) const;

 private:
  struct ComponentRecord {
    ComponentRecord() : completed(0), terminated_with_error(0), failures(0) {}
    uint64_t completed;
    uint64_t terminated_with_error;
    uint64_t failures;
    string last_blocking_reason;
  };

  static bool IsPlaced(const InstanceDescriptor& id);
  uint64_t BackoffFor(uint64_t attempts) const;
  void ApplyPlan(const PlacementPlan& plan);
  void BeginTermination(InstanceDescriptor* id, const string& reason);
  InstanceID_t CreateInstance(const ComponentSpec& component);
  agent::LaunchCommand ExpandLaunchCommand(const InstanceDescriptor& id) const;
  void HandleFailure(InstanceDescriptor* id, FailureKind kind,
                     const string& reason);
  void IssueKill(InstanceDescriptor* id);
  void IssueLaunch(InstanceDescriptor* id);
  void ReleaseCapacity(InstanceDescriptor* id);
  void ScaleComponent(const string& component, uint64_t desired);
  void Terminate(InstanceDescriptor* id, const string& reason);
  void Transition(InstanceDescriptor* id,
                  InstanceDescriptor::InstanceState new_state,
                  const string& reason);

  shared_ptr<const ScheduleSpec> spec_;
  shared_ptr<NodeCatalog> node_catalog_;
  NodeAgentInterface* node_agent_;
  InstanceEventNotifierInterface* event_notifier_;
  TimeInterface* time_manager_;
  InstanceReportSink report_sink_;
  unique_ptr<Allocator> allocator_;
  // The authoritative instance map. Ordered by id, which is creation order.
  map<InstanceID_t, InstanceDescriptor> instances_;
  map<string, ComponentRecord> components_;
  ReplicaCountMap_t desired_;
};

}  // namespace scheduler
}  // namespace meadow

#endif  // MEADOW_SCHEDULING_INSTANCE_SUPERVISOR_H
