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

// Instance supervisor: reconciliation and the per-instance state machine.

#include "scheduling/instance_supervisor.h"

#include <algorithm>
#include <utility>

#include <boost/algorithm/string.hpp>
#include <boost/bind.hpp>

#include "base/units.h"
#include "misc/utils.h"

DEFINE_uint64(max_instance_attempts, 3,
              "Number of failed launch or run attempts after which an "
              "instance is terminated with an error.");
DEFINE_uint64(launch_timeout_ms, 60000,
              "Time an instance may spend launching before the launch is "
              "considered failed.");
DEFINE_uint64(retry_backoff_initial_ms, 1000,
              "Delay before the first retry of a failed or unplaceable "
              "instance. Doubles on every further attempt.");
DEFINE_uint64(retry_backoff_max_ms, 30000,
              "Upper bound on the retry delay.");
DEFINE_uint64(infeasible_warning_ticks, 10,
              "Number of consecutive failed placement rounds after which an "
              "unplaceable instance is reported as a warning.");
DEFINE_uint64(max_placement_attempts, 300,
              "Number of consecutive failed placement rounds after which an "
              "unplaceable instance is terminated with an error.");

namespace meadow {
namespace scheduler {

namespace {

void DeliverReport(InstanceReportSink sink, InstanceID_t instance_id,
                   const NodeID_t& node_id, uint64_t placement_epoch,
                   const AgentResult& result) {
  InstanceReport report;
  report.instance_id = instance_id;
  report.node_id = node_id;
  report.placement_epoch = placement_epoch;
  report.result = result;
  sink(report);
}

// Order in which live instances are picked for scale-down.
uint32_t ScaleDownRank(InstanceDescriptor::InstanceState state) {
  switch (state) {
    case InstanceDescriptor::PENDING:
      return 0;
    case InstanceDescriptor::LAUNCHING:
      return 1;
    default:
      return 2;
  }
}

}  // namespace

InstanceSupervisor::InstanceSupervisor(
    shared_ptr<const ScheduleSpec> spec,
    shared_ptr<NodeCatalog> node_catalog,
    NodeAgentInterface* node_agent,
    InstanceEventNotifierInterface* event_notifier,
    TimeInterface* time_manager,
    InstanceReportSink report_sink)
  : spec_(spec), node_catalog_(node_catalog), node_agent_(node_agent),
    event_notifier_(event_notifier), time_manager_(time_manager),
    report_sink_(report_sink),
    allocator_(new Allocator(spec->allocation_mode(), spec->metric())) {
  CHECK_NOTNULL(node_catalog_.get());
  CHECK_NOTNULL(node_agent_);
  CHECK_NOTNULL(time_manager_);
  CHECK(report_sink_) << "An instance supervisor needs a report sink";
  VLOG(1) << "InstanceSupervisor for schedule " << spec_->name()
          << " initiated with " << *node_agent_;
}

void InstanceSupervisor::Reconcile(const ReplicaCountMap_t& desired,
                                   const vector<NodeState>& snapshot) {
  desired_ = desired;
  // Components that still have instances but are no longer desired scale
  // down to zero.
  set<string> components;
  for (const auto& name_count : desired_)
    components.insert(name_count.first);
  for (const auto& id_instance : instances_)
    components.insert(id_instance.second.component_name());
  for (const string& component : components) {
    ReplicaCountMap_t::const_iterator it = desired_.find(component);
    ScaleComponent(component, it == desired_.end() ? 0 : it->second);
  }
  // Kills that failed earlier are retried. Launching instances are killed
  // once they report having started.
  for (auto& id_instance : instances_) {
    InstanceDescriptor* id = &id_instance.second;
    if (id->terminating() && !id->kill_in_flight() &&
        id->state() == InstanceDescriptor::RUNNING) {
      IssueKill(id);
    }
  }
  uint64_t now = time_manager_->GetCurrentTimestamp();
  vector<PlacementRequest> requests;
  for (const auto& id_instance : instances_) {
    const InstanceDescriptor& id = id_instance.second;
    if (id.state() != InstanceDescriptor::PENDING || id.terminating() ||
        id.next_attempt_at() > now) {
      continue;
    }
    requests.push_back(PlacementRequest(id.uid(), id.component_name(),
                                        ResourceVector(id.resource_request())));
  }
  if (!requests.empty()) {
    VLOG(1) << "Placing " << requests.size() << " pending instances of "
            << "schedule " << spec_->name() << " on " << snapshot.size()
            << " nodes";
    ApplyPlan(allocator_->Allocate(requests, snapshot));
  }
  // A component without pending instances is no longer blocked.
  for (auto& name_record : components_) {
    bool blocked = false;
    for (const auto& id_instance : instances_) {
      if (id_instance.second.component_name() == name_record.first &&
          id_instance.second.state() == InstanceDescriptor::PENDING) {
        blocked = true;
        break;
      }
    }
    if (!blocked && name_record.second.terminated_with_error == 0)
      name_record.second.last_blocking_reason.clear();
  }
}

void InstanceSupervisor::ScaleComponent(const string& component,
                                        uint64_t desired) {
  ComponentRecord* record = &components_[component];
  vector<InstanceDescriptor*> live;
  for (auto& id_instance : instances_) {
    InstanceDescriptor* id = &id_instance.second;
    if (id->component_name() == component && !id->terminating())
      live.push_back(id);
  }
  uint64_t accounted = live.size() + record->completed +
      record->terminated_with_error;
  if (desired > accounted) {
    const ComponentSpec* cs = spec_->FindComponent(component);
    if (!cs) {
      LOG(WARNING) << "Schedule " << spec_->name() << " has no component "
                   << component << "; cannot create replicas for it";
      return;
    }
    VLOG(1) << "Creating " << desired - accounted << " instances of "
            << component;
    for (uint64_t i = accounted; i < desired; ++i)
      CreateInstance(*cs);
  } else if (desired < accounted && !live.empty()) {
    uint64_t excess = min(accounted - desired,
                          static_cast<uint64_t>(live.size()));
    sort(live.begin(), live.end(),
         [](const InstanceDescriptor* a, const InstanceDescriptor* b) {
           uint32_t rank_a = ScaleDownRank(a->state());
           uint32_t rank_b = ScaleDownRank(b->state());
           if (rank_a != rank_b)
             return rank_a < rank_b;
           return a->uid() > b->uid();
         });
    VLOG(1) << "Scaling " << component << " down by " << excess;
    for (uint64_t i = 0; i < excess; ++i)
      BeginTermination(live[i], "scaled down");
  }
}

InstanceID_t InstanceSupervisor::CreateInstance(
    const ComponentSpec& component) {
  InstanceID_t instance_id = GenerateInstanceID();
  if (instances_.find(instance_id) != instances_.end()) {
    throw InvariantViolation("duplicate instance id " +
                             to_string(instance_id));
  }
  InstanceDescriptor* id = &instances_[instance_id];
  id->set_uid(instance_id);
  id->set_schedule_name(spec_->name());
  id->set_component_name(component.name);
  component.resource_request.ToProtobuf(id->mutable_resource_request());
  id->set_state(InstanceDescriptor::PENDING);
  id->set_created_at(time_manager_->GetCurrentTimestamp());
  Transition(id, InstanceDescriptor::PENDING, "created");
  return instance_id;
}

void InstanceSupervisor::ApplyPlan(const PlacementPlan& plan) {
  uint64_t now = time_manager_->GetCurrentTimestamp();
  for (const auto& assignment : plan.assignments) {
    InstanceDescriptor* id = &instances_.at(assignment.first);
    const NodeID_t& node_id = assignment.second;
    if (!spec_->FindComponent(id->component_name())) {
      // The component left the schedule while this instance was pending.
      string reason = "component " + id->component_name() +
          " is no longer part of the schedule";
      LOG(WARNING) << "Not launching instance " << id->uid() << " of schedule "
                   << spec_->name() << ": " << reason;
      Terminate(id, reason);
      continue;
    }
    ResourceVector request(id->resource_request());
    uint64_t incarnation = 0;
    CatalogStatus status = node_catalog_->Reserve(node_id, request,
                                                  &incarnation);
    if (status != CATALOG_OK) {
      // The snapshot went stale, e.g. because another schedule placed
      // something on the node in the meantime.
      string reason = string(FailureKindToString(INSUFFICIENT_CAPACITY)) +
          ": reservation on " + node_id + " failed (" +
          CatalogStatusToString(status) + ")";
      LOG(WARNING) << "Instance " << id->uid() << " of schedule "
                   << spec_->name() << ": " << reason
                   << "; will retry next round";
      id->set_last_reason(reason);
      components_[id->component_name()].last_blocking_reason = reason;
      continue;
    }
    id->set_node_id(node_id);
    id->set_node_incarnation(incarnation);
    id->set_placement_epoch(id->placement_epoch() + 1);
    id->set_placement_attempts(0);
    id->set_launch_started_at(now);
    Transition(id, InstanceDescriptor::LAUNCHING, "");
    IssueLaunch(id);
  }
  for (InstanceID_t instance_id : plan.infeasible) {
    InstanceDescriptor* id = &instances_.at(instance_id);
    ResourceVector request(id->resource_request());
    id->set_placement_attempts(id->placement_attempts() + 1);
    string reason = string(FailureKindToString(INFEASIBLE_PLACEMENT)) +
        ": no ready node can fit " + request.DebugString();
    id->set_last_reason(reason);
    components_[id->component_name()].last_blocking_reason = reason;
    if (id->placement_attempts() == FLAGS_infeasible_warning_ticks) {
      LOG(WARNING) << "Instance " << instance_id << " ("
                   << spec_->name() << "/" << id->component_name()
                   << ") could not be placed in "
                   << id->placement_attempts() << " rounds: " << reason;
    }
    if (id->placement_attempts() >= FLAGS_max_placement_attempts) {
      ComponentRecord* record = &components_[id->component_name()];
      record->terminated_with_error++;
      Terminate(id, reason);
      continue;
    }
    id->set_next_attempt_at(now + BackoffFor(id->placement_attempts()));
  }
}

agent::LaunchCommand InstanceSupervisor::ExpandLaunchCommand(
    const InstanceDescriptor& id) const {
  agent::LaunchCommand command;
  command.schedule_name = spec_->name();
  command.component_name = id.component_name();
  const ComponentSpec* cs = spec_->FindComponent(id.component_name());
  CHECK_NOTNULL(cs);
  command.image = cs->image;
  command.mount_target = cs->mount_target;
  command.command = cs->launch_command_template;
  boost::algorithm::replace_all(command.command, "{instance_id}",
                                to_string(id.uid()));
  boost::algorithm::replace_all(command.command, "{component}",
                                id.component_name());
  boost::algorithm::replace_all(command.command, "{schedule}",
                                spec_->name());
  boost::algorithm::replace_all(command.command, "{node}", id.node_id());
  return command;
}

void InstanceSupervisor::IssueLaunch(InstanceDescriptor* id) {
  VLOG(1) << "Launching instance " << id->uid() << " ("
          << id->component_name() << ") on node " << id->node_id()
          << ", epoch " << id->placement_epoch();
  node_agent_->Launch(id->node_id(), id->uid(), ExpandLaunchCommand(*id),
                      ResourceVector(id->resource_request()),
                      boost::bind(&DeliverReport, report_sink_, id->uid(),
                                  id->node_id(), id->placement_epoch(), _1));
}

void InstanceSupervisor::IssueKill(InstanceDescriptor* id) {
  VLOG(1) << "Killing instance " << id->uid() << " ("
          << id->component_name() << ") on node " << id->node_id();
  id->set_kill_in_flight(true);
  node_agent_->Kill(id->node_id(), id->uid(),
                    boost::bind(&DeliverReport, report_sink_, id->uid(),
                                id->node_id(), id->placement_epoch(), _1));
}

void InstanceSupervisor::BeginTermination(InstanceDescriptor* id,
                                          const string& reason) {
  if (id->state() == InstanceDescriptor::PENDING) {
    Terminate(id, reason);
    return;
  }
  id->set_terminating(true);
  id->set_last_reason(reason);
  if (id->state() == InstanceDescriptor::RUNNING)
    IssueKill(id);
}

void InstanceSupervisor::HandleNodeEvent(const NodeID_t& node_id,
                                         NodeEventType event) {
  if (event != NODE_EVENT_UNREACHABLE && event != NODE_EVENT_REMOVED)
    return;
  string reason = string(FailureKindToString(AGENT_UNREACHABLE)) + ": node " +
      node_id + " " + (event == NODE_EVENT_REMOVED ? "removed" : "unreachable");
  vector<InstanceID_t> evicted;
  for (const auto& id_instance : instances_) {
    if (IsPlaced(id_instance.second) &&
        id_instance.second.node_id() == node_id) {
      evicted.push_back(id_instance.first);
    }
  }
  if (!evicted.empty()) {
    LOG(INFO) << "Evicting " << evicted.size() << " instances of schedule "
              << spec_->name() << " from node " << node_id;
  }
  uint64_t now = time_manager_->GetCurrentTimestamp();
  for (InstanceID_t instance_id : evicted) {
    InstanceDescriptor* id = &instances_.at(instance_id);
    ReleaseCapacity(id);
    if (id->terminating()) {
      Terminate(id, reason);
      continue;
    }
    Transition(id, InstanceDescriptor::PENDING, reason);
    id->clear_node_id();
    id->set_node_incarnation(0);
    id->set_kill_in_flight(false);
    id->set_next_attempt_at(now);
  }
}

void InstanceSupervisor::HandleInstanceEvent(const InstanceReport& report) {
  map<InstanceID_t, InstanceDescriptor>::iterator it =
    instances_.find(report.instance_id);
  if (it == instances_.end()) {
    VLOG(1) << "Ignoring " << AgentResultTypeToString(report.result.type)
            << " report for unknown instance " << report.instance_id;
    return;
  }
  InstanceDescriptor* id = &it->second;
  if (!IsPlaced(*id) || id->node_id() != report.node_id ||
      id->placement_epoch() != report.placement_epoch) {
    LOG(WARNING) << "Ignoring stale "
                 << AgentResultTypeToString(report.result.type)
                 << " report for instance " << report.instance_id
                 << " (node " << report.node_id << ", epoch "
                 << report.placement_epoch << "; now "
                 << InstanceStateToString(id->state()) << " on "
                 << (id->node_id().empty() ? "no node" : id->node_id())
                 << ", epoch " << id->placement_epoch() << ")";
    return;
  }
  VLOG(2) << "Instance " << report.instance_id << " reported "
          << AgentResultTypeToString(report.result.type);
  switch (report.result.type) {
    case AgentResult::STARTED:
      if (id->state() != InstanceDescriptor::LAUNCHING)
        return;
      Transition(id, InstanceDescriptor::RUNNING, "");
      if (id->terminating())
        IssueKill(id);
      break;
    case AgentResult::EXITED_OK:
      if (id->terminating()) {
        Terminate(id, id->last_reason());
      } else {
        components_[id->component_name()].completed++;
        Terminate(id, "");
      }
      break;
    case AgentResult::EXITED_ERROR:
    case AgentResult::CRASHED:
      HandleFailure(id, LAUNCH_FAILURE, report.result.reason);
      break;
    case AgentResult::LAUNCH_FAILED:
      HandleFailure(id, LAUNCH_FAILURE, report.result.reason);
      break;
    case AgentResult::AGENT_UNREACHABLE:
      HandleFailure(id, AGENT_UNREACHABLE, report.result.reason);
      break;
    case AgentResult::KILLED:
      if (id->terminating()) {
        Terminate(id, id->last_reason());
      } else {
        // Killed by someone other than us; counts against the instance.
        HandleFailure(id, LAUNCH_FAILURE, "killed externally");
      }
      break;
    case AgentResult::KILL_FAILED:
      LOG(WARNING) << "Kill of instance " << id->uid() << " on "
                   << id->node_id() << " failed: " << report.result.reason
                   << "; will retry";
      id->set_kill_in_flight(false);
      break;
  }
}

void InstanceSupervisor::HandleFailure(InstanceDescriptor* id,
                                       FailureKind kind,
                                       const string& reason) {
  string full_reason = string(FailureKindToString(kind)) + ": " +
      (reason.empty() ? "no reason given" : reason);
  ReleaseCapacity(id);
  Transition(id, InstanceDescriptor::FAILED, full_reason);
  id->clear_node_id();
  id->set_kill_in_flight(false);
  ComponentRecord* record = &components_[id->component_name()];
  if (id->terminating()) {
    // Nothing to retry for an instance that was going away anyway.
    Terminate(id, full_reason);
    return;
  }
  id->set_attempt_count(id->attempt_count() + 1);
  record->failures++;
  record->last_blocking_reason = full_reason;
  if (id->attempt_count() < FLAGS_max_instance_attempts) {
    id->set_next_attempt_at(time_manager_->GetCurrentTimestamp() +
                            BackoffFor(id->attempt_count()));
    Transition(id, InstanceDescriptor::PENDING,
               "retrying after attempt " + to_string(id->attempt_count()));
    return;
  }
  LOG(WARNING) << "Instance " << id->uid() << " (" << spec_->name() << "/"
               << id->component_name() << ") failed "
               << id->attempt_count() << " times; giving up";
  record->terminated_with_error++;
  Terminate(id, full_reason);
}

uint64_t InstanceSupervisor::CheckLaunchTimeouts() {
  uint64_t now = time_manager_->GetCurrentTimestamp();
  uint64_t timeout = FLAGS_launch_timeout_ms * MILLISECONDS_TO_MICROSECONDS;
  vector<InstanceID_t> timed_out;
  for (const auto& id_instance : instances_) {
    const InstanceDescriptor& id = id_instance.second;
    if (id.state() == InstanceDescriptor::LAUNCHING &&
        now - id.launch_started_at() >= timeout) {
      timed_out.push_back(id.uid());
    }
  }
  for (InstanceID_t instance_id : timed_out) {
    InstanceDescriptor* id = &instances_.at(instance_id);
    LOG(WARNING) << "Launch of instance " << instance_id << " on "
                 << id->node_id() << " timed out";
    // Best effort; the outcome of the kill refers to a placement that no
    // longer exists by the time it arrives.
    IssueKill(id);
    HandleFailure(id, LAUNCH_FAILURE,
                  "launch timed out after " +
                  to_string(FLAGS_launch_timeout_ms) + "ms");
  }
  return timed_out.size();
}

void InstanceSupervisor::ReleaseCapacity(InstanceDescriptor* id) {
  if (id->node_id().empty() || id->node_incarnation() == 0)
    return;
  CatalogStatus status = node_catalog_->Release(
      id->node_id(), ResourceVector(id->resource_request()),
      id->node_incarnation());
  if (status != CATALOG_OK) {
    VLOG(1) << "Capacity of instance " << id->uid() << " on node "
            << id->node_id() << " not returned: "
            << CatalogStatusToString(status);
  }
  id->set_node_incarnation(0);
}

void InstanceSupervisor::Terminate(InstanceDescriptor* id,
                                   const string& reason) {
  ReleaseCapacity(id);
  Transition(id, InstanceDescriptor::TERMINATED, reason);
  instances_.erase(id->uid());
}

void InstanceSupervisor::Transition(
    InstanceDescriptor* id, InstanceDescriptor::InstanceState new_state,
    const string& reason) {
  InstanceDescriptor::InstanceState old_state = id->state();
  id->set_state(new_state);
  if (!reason.empty())
    id->set_last_reason(reason);
  VLOG(2) << "Instance " << id->uid() << ": "
          << InstanceStateToString(old_state) << " -> "
          << InstanceStateToString(new_state);
  if (!event_notifier_)
    return;
  InstanceEvent event;
  event.set_instance_id(id->uid());
  event.set_schedule_name(spec_->name());
  event.set_component_name(id->component_name());
  event.set_node_id(id->node_id());
  event.set_old_state(old_state);
  event.set_new_state(new_state);
  event.set_timestamp(time_manager_->GetCurrentTimestamp());
  event.set_reason(reason);
  event_notifier_->OnInstanceEvent(event);
}

ComponentStatusMap InstanceSupervisor::Status() const {
  ComponentStatusMap status;
  for (const auto& name_count : desired_)
    status[name_count.first].desired = name_count.second;
  for (const auto& name_record : components_) {
    ComponentStatus* cs = &status[name_record.first];
    cs->completed = name_record.second.completed;
    cs->terminated_with_error = name_record.second.terminated_with_error;
    cs->failures = name_record.second.failures;
    cs->last_blocking_reason = name_record.second.last_blocking_reason;
  }
  for (const auto& id_instance : instances_) {
    const InstanceDescriptor& id = id_instance.second;
    ComponentStatus* cs = &status[id.component_name()];
    switch (id.state()) {
      case InstanceDescriptor::PENDING:
        cs->pending++;
        break;
      case InstanceDescriptor::LAUNCHING:
        cs->launching++;
        break;
      case InstanceDescriptor::RUNNING:
        cs->running++;
        break;
      default:
        break;
    }
    if (id.terminating())
      cs->terminating++;
  }
  return status;
}

uint64_t InstanceSupervisor::NumLiveInstances() const {
  return instances_.size();
}

void InstanceSupervisor::ReleaseAll(const string& reason) {
  if (!instances_.empty()) {
    LOG(INFO) << "Releasing " << instances_.size() << " instances of "
              << "schedule " << spec_->name() << ": " << reason;
  }
  while (!instances_.empty())
    Terminate(&instances_.begin()->second, reason);
}

void InstanceSupervisor::UpdateSpec(shared_ptr<const ScheduleSpec> spec) {
  CHECK_EQ(spec->name(), spec_->name());
  if (spec->allocation_mode() != spec_->allocation_mode() ||
      spec->metric() != spec_->metric()) {
    allocator_.reset(new Allocator(spec->allocation_mode(), spec->metric()));
  }
  spec_ = spec;
}

bool InstanceSupervisor::GetInstance(InstanceID_t instance_id,
                                     InstanceDescriptor* id) const {
  map<InstanceID_t, InstanceDescriptor>::const_iterator it =
    instances_.find(instance_id);
  if (it == instances_.end())
    return false;
  id->CopyFrom(it->second);
  return true;
}

vector<InstanceID_t> InstanceSupervisor::InstancesOfComponent(
    const string& component) const {
  vector<InstanceID_t> ids;
  for (const auto& id_instance : instances_) {
    if (id_instance.second.component_name() == component)
      ids.push_back(id_instance.first);
  }
  return ids;
}

bool InstanceSupervisor::IsPlaced(const InstanceDescriptor& id) {
  return id.state() == InstanceDescriptor::LAUNCHING ||
      id.state() == InstanceDescriptor::RUNNING;
}

uint64_t InstanceSupervisor::BackoffFor(uint64_t attempts) const {
  uint64_t backoff_ms = FLAGS_retry_backoff_initial_ms;
  for (uint64_t i = 1; i < attempts && backoff_ms < FLAGS_retry_backoff_max_ms;
       ++i) {
    backoff_ms *= 2;
  }
  return min(backoff_ms, FLAGS_retry_backoff_max_ms) *
      MILLISECONDS_TO_MICROSECONDS;
}

}  // namespace scheduler
}  // namespace meadow
