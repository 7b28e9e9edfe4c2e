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

// Schedule runner.

#include "scheduling/schedule_runner.h"

#include <string>

namespace meadow {
namespace scheduler {

const char* ScheduleStateToString(ScheduleState state) {
  switch (state) {
    case SCHEDULE_PENDING:
      return "PENDING";
    case SCHEDULE_RUNNING:
      return "RUNNING";
    case SCHEDULE_DRAINING:
      return "DRAINING";
    case SCHEDULE_COMPLETED:
      return "COMPLETED";
    case SCHEDULE_FAILED:
      return "FAILED";
  }
  return "UNKNOWN";
}

ostream& operator<<(ostream& stream, const ScheduleStatus& status) {
  stream << "schedule " << status.schedule_name << ": "
         << ScheduleStateToString(status.state)
         << (status.cancel_requested ? " (cancelled)" : "")
         << (status.finished ? " (finished)" : "") << ", "
         << status.live_instances << " live instances";
  for (const auto& name_status : status.components) {
    const ComponentStatus& cs = name_status.second;
    stream << "; " << name_status.first << ": desired=" << cs.desired
           << " pending=" << cs.pending << " launching=" << cs.launching
           << " running=" << cs.running << " completed=" << cs.completed
           << " errored=" << cs.terminated_with_error;
  }
  if (!status.failure_reason.empty())
    stream << "; reason: " << status.failure_reason;
  return stream;
}

ScheduleEvent ScheduleEvent::ForNode(const NodeID_t& node_id,
                                     NodeEventType node_event) {
  ScheduleEvent event;
  event.type = NODE_EVENT;
  event.node_id = node_id;
  event.node_event = node_event;
  return event;
}

ScheduleEvent ScheduleEvent::ForReport(const InstanceReport& report) {
  ScheduleEvent event;
  event.type = INSTANCE_REPORT;
  event.report = report;
  return event;
}

ScheduleEvent ScheduleEvent::Cancel() {
  ScheduleEvent event;
  event.type = CANCEL;
  return event;
}

ScheduleEvent ScheduleEvent::ForSpec(shared_ptr<const ScheduleSpec> spec) {
  ScheduleEvent event;
  event.type = UPDATE_SPEC;
  event.spec = spec;
  return event;
}

ScheduleRunner::ScheduleRunner(
    shared_ptr<const ScheduleSpec> spec,
    shared_ptr<NodeCatalog> node_catalog,
    NodeAgentInterface* node_agent,
    InstanceEventNotifierInterface* event_notifier,
    TimeInterface* time_manager,
    InstanceReportSink report_sink)
  : spec_(spec), node_catalog_(node_catalog), time_manager_(time_manager),
    supervisor_(new InstanceSupervisor(spec, node_catalog, node_agent,
                                       event_notifier, time_manager,
                                       report_sink)),
    failing_(false), frozen_(false) {
  UpdateStatus();
}

void ScheduleRunner::HandleEvent(const ScheduleEvent& event) {
  if (frozen_) {
    if (event.type == ScheduleEvent::CANCEL)
      status_.cancel_requested = true;
    VLOG(1) << "Schedule " << name() << " is frozen; ignoring event of type "
            << event.type;
    return;
  }
  try {
    DispatchEvent(event);
  } catch (const InvariantViolation& violation) {
    Freeze(violation);
  }
  UpdateStatus();
}

void ScheduleRunner::DispatchEvent(const ScheduleEvent& event) {
  switch (event.type) {
    case ScheduleEvent::NODE_EVENT:
      VLOG(1) << "Schedule " << name() << ": node " << event.node_id << " "
              << NodeEventTypeToString(event.node_event);
      supervisor_->HandleNodeEvent(event.node_id, event.node_event);
      break;
    case ScheduleEvent::INSTANCE_REPORT:
      supervisor_->HandleInstanceEvent(event.report);
      break;
    case ScheduleEvent::CANCEL:
      if (status_.cancel_requested || status_.finished) {
        VLOG(1) << "Schedule " << name() << " already cancelled or finished";
        return;
      }
      LOG(INFO) << "Cancelling schedule " << name() << " with "
                << supervisor_->NumLiveInstances() << " live instances";
      status_.cancel_requested = true;
      if (!failing_)
        status_.state = SCHEDULE_DRAINING;
      break;
    case ScheduleEvent::UPDATE_SPEC:
      if (status_.cancel_requested || status_.finished || failing_) {
        LOG(WARNING) << "Ignoring update of schedule " << name()
                     << ", which is no longer running";
        return;
      }
      if (!event.spec || event.spec->name() != name()) {
        LOG(WARNING) << "Ignoring update of schedule " << name()
                     << " to a spec with a different name";
        return;
      }
      LOG(INFO) << "Updating schedule " << name() << " to "
                << event.spec->job_names().size() << " jobs";
      spec_ = event.spec;
      supervisor_->UpdateSpec(spec_);
      break;
  }
}

ScheduleStatus ScheduleRunner::RunIteration() {
  if (status_.finished)
    return status_;
  try {
    supervisor_->CheckLaunchTimeouts();
    ReplicaCountMap_t desired;
    if (status_.cancel_requested || failing_) {
      for (const auto& name_component : spec_->components())
        desired[name_component.first] = 0;
    } else {
      desired = spec_->DesiredReplicaCounts();
    }
    supervisor_->Reconcile(desired, node_catalog_->Snapshot());
    EvaluateState();
  } catch (const InvariantViolation& violation) {
    Freeze(violation);
  }
  UpdateStatus();
  return status_;
}

void ScheduleRunner::EvaluateState() {
  status_.components = supervisor_->Status();
  status_.live_instances = supervisor_->NumLiveInstances();
  if (status_.cancel_requested || failing_) {
    if (status_.live_instances > 0)
      return;
    // A schedule that is failing keeps the reason it started failing for;
    // blocking reasons from before a cancel no longer apply.
    if (!failing_)
      status_.failure_reason.clear();
    bool errored = failing_ || !ErroredComponentReason().empty();
    Finish(errored ? SCHEDULE_FAILED : SCHEDULE_COMPLETED);
    return;
  }
  bool done = true;
  bool errored = false;
  string blocking;
  for (const auto& name_status : status_.components) {
    const ComponentStatus& cs = name_status.second;
    string reason = "component " + name_status.first + ": " +
        cs.last_blocking_reason;
    if (cs.desired > 0 && cs.terminated_with_error >= cs.desired) {
      // No replica of this component is left; the schedule cannot succeed.
      LOG(WARNING) << "Schedule " << name() << " failed: " << reason;
      failing_ = true;
      status_.state = SCHEDULE_FAILED;
      status_.failure_reason = reason;
      if (status_.live_instances == 0)
        Finish(SCHEDULE_FAILED);
      return;
    }
    if (cs.live() > 0 || cs.completed + cs.terminated_with_error < cs.desired)
      done = false;
    if (cs.terminated_with_error > 0)
      errored = true;
    if (!cs.last_blocking_reason.empty() && blocking.empty())
      blocking = reason;
  }
  status_.failure_reason = blocking;
  if (done && status_.live_instances == 0) {
    status_.failure_reason.clear();
    Finish(errored ? SCHEDULE_FAILED : SCHEDULE_COMPLETED);
    return;
  }
  status_.state = SCHEDULE_RUNNING;
}

string ScheduleRunner::ErroredComponentReason() const {
  for (const auto& name_status : status_.components) {
    if (name_status.second.terminated_with_error > 0) {
      return "component " + name_status.first + ": " +
          name_status.second.last_blocking_reason;
    }
  }
  return "";
}

void ScheduleRunner::Finish(ScheduleState state) {
  status_.state = state;
  if (state == SCHEDULE_COMPLETED) {
    status_.failure_reason.clear();
  } else if (status_.failure_reason.empty()) {
    status_.failure_reason = ErroredComponentReason();
  }
  status_.finished = true;
  supervisor_->ReleaseAll("schedule finished");
  if (state == SCHEDULE_FAILED) {
    LOG(WARNING) << "Schedule " << name() << " finished as FAILED: "
                 << status_.failure_reason;
  } else {
    LOG(INFO) << "Schedule " << name() << " finished as "
              << ScheduleStateToString(state);
  }
}

void ScheduleRunner::Freeze(const InvariantViolation& violation) {
  LOG(ERROR) << "Invariant violation in schedule " << name() << ": "
             << violation.what() << "; freezing it";
  frozen_ = true;
  status_.state = SCHEDULE_FAILED;
  status_.finished = true;
  status_.failure_reason = string(FailureKindToString(INVARIANT_VIOLATION)) +
      ": " + violation.what();
  status_.components = supervisor_->Status();
  status_.live_instances = supervisor_->NumLiveInstances();
}

void ScheduleRunner::UpdateStatus() {
  status_.schedule_name = name();
  status_.timestamp = time_manager_->GetCurrentTimestamp();
  if (!frozen_) {
    status_.components = supervisor_->Status();
    status_.live_instances = supervisor_->NumLiveInstances();
  }
}

}  // namespace scheduler
}  // namespace meadow
