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

// The schedule runner drives a single schedule: it folds schedule events
// into its instance supervisor, runs one reconciliation per iteration and
// derives the schedule-level state from the supervisor's status. Like the
// supervisor it is single-threaded; a ControlLoop serializes calls into it.
//
// An InvariantViolation thrown while handling an event or running an
// iteration freezes the schedule: it is marked FAILED, its instances are
// left untouched for inspection, and subsequent events are ignored.

#ifndef MEADOW_SCHEDULING_SCHEDULE_RUNNER_H
#define MEADOW_SCHEDULING_SCHEDULE_RUNNER_H

#include <string>

#include "base/common.h"
#include "base/schedule_spec.h"
#include "base/types.h"
#include "engine/node_agent_interface.h"
#include "misc/time_sources.h"
#include "scheduling/instance_event_notifier_interface.h"
#include "scheduling/instance_supervisor.h"
#include "scheduling/node_catalog.h"

namespace meadow {
namespace scheduler {

enum ScheduleState {
  SCHEDULE_PENDING = 0,
  SCHEDULE_RUNNING = 1,
  SCHEDULE_DRAINING = 2,
  SCHEDULE_COMPLETED = 3,
  SCHEDULE_FAILED = 4,
};

const char* ScheduleStateToString(ScheduleState state);

struct ScheduleStatus {
  ScheduleStatus()
    : state(SCHEDULE_PENDING), cancel_requested(false), finished(false),
      live_instances(0), timestamp(0) {}
  string schedule_name;
  ScheduleState state;
  bool cancel_requested;
  // Set once the schedule will not change any more: it has drained to zero
  // instances after completing, failing or being cancelled, or it is frozen.
  bool finished;
  uint64_t live_instances;
  ComponentStatusMap components;
  // Why the schedule failed, or what currently blocks it.
  string failure_reason;
  uint64_t timestamp;
};

ostream& operator<<(ostream& stream, const ScheduleStatus& status);

struct ScheduleEvent {
  enum EventType {
    NODE_EVENT = 0,
    INSTANCE_REPORT = 1,
    CANCEL = 2,
    UPDATE_SPEC = 3,
  };

  static ScheduleEvent ForNode(const NodeID_t& node_id, NodeEventType event);
  static ScheduleEvent ForReport(const InstanceReport& report);
  static ScheduleEvent Cancel();
  static ScheduleEvent ForSpec(shared_ptr<const ScheduleSpec> spec);

  ScheduleEvent() : type(CANCEL), node_event(NODE_EVENT_READY) {}
  EventType type;
  NodeID_t node_id;
  NodeEventType node_event;
  InstanceReport report;
  shared_ptr<const ScheduleSpec> spec;
};

class ScheduleRunner {
 public:
  ScheduleRunner(shared_ptr<const ScheduleSpec> spec,
                 shared_ptr<NodeCatalog> node_catalog,
                 NodeAgentInterface* node_agent,
                 InstanceEventNotifierInterface* event_notifier,
                 TimeInterface* time_manager,
                 InstanceReportSink report_sink);

  void HandleEvent(const ScheduleEvent& event);

  /**
   * Runs one control loop iteration: launch timeouts, reconciliation against
   * a fresh node catalog snapshot, and evaluation of the schedule state.
   * A no-op once the schedule has finished.
   * @return the status after the iteration
   */
  ScheduleStatus RunIteration();

  inline const ScheduleStatus& status() const { return status_; }
  inline const string& name() const { return spec_->name(); }
  inline const InstanceSupervisor& supervisor() const { return *supervisor_; }

 private:
  void DispatchEvent(const ScheduleEvent& event);
  void EvaluateState();
  // The reason of the first component that has replicas terminated with an
  // error, or "" if there is none.
  string ErroredComponentReason() const;
  void Freeze(const InvariantViolation& violation);
  void Finish(ScheduleState state);
  void UpdateStatus();

  shared_ptr<const ScheduleSpec> spec_;
  shared_ptr<NodeCatalog> node_catalog_;
  TimeInterface* time_manager_;
  unique_ptr<InstanceSupervisor> supervisor_;
  ScheduleStatus status_;
  // Set once a component has run out of replicas; the schedule then drains.
  bool failing_;
  bool frozen_;
};

}  // namespace scheduler
}  // namespace meadow

#endif  // MEADOW_SCHEDULING_SCHEDULE_RUNNER_H
