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

// The schedule controller is the top-level driver. It owns one control loop
// (and schedule runner) per unfinished schedule, routes cancel and update
// requests to the owning loop, and fans node events out to every loop. A
// loop retires when its schedule finishes; the controller then drops it and
// keeps the final status for listing. All its methods are thread-safe.

#ifndef MEADOW_SCHEDULING_SCHEDULE_CONTROLLER_H
#define MEADOW_SCHEDULING_SCHEDULE_CONTROLLER_H

#include <map>
#include <string>
#include <vector>

#include <boost/thread/shared_mutex.hpp>

#include "base/common.h"
#include "base/schedule_spec.h"
#include "base/types.h"
#include "engine/node_agent_interface.h"
#include "misc/time_sources.h"
#include "scheduling/control_loop.h"
#include "scheduling/instance_event_notifier_interface.h"
#include "scheduling/node_catalog.h"
#include "scheduling/schedule_runner.h"

namespace meadow {
namespace scheduler {

class ScheduleController {
 public:
  ScheduleController(shared_ptr<NodeCatalog> node_catalog,
                     NodeAgentInterface* node_agent,
                     InstanceEventNotifierInterface* event_notifier,
                     TimeInterface* time_manager);
  ~ScheduleController();

  /**
   * Starts running a schedule. A finished schedule of the same name is
   * replaced; an unfinished one is not.
   * @param spec the schedule to run
   * @param error set to the reason if the schedule was not activated
   * @return true if the schedule is now running
   */
  bool ActivateSchedule(shared_ptr<const ScheduleSpec> spec, string* error);

  /**
   * Replaces the spec of a running schedule by a new version, e.g. after its
   * job names changed.
   * @param spec the new version; must carry the name of a running schedule
   * @param error set to the reason if the update was rejected
   * @return true if the update was handed to the schedule's control loop
   */
  bool UpdateSchedule(shared_ptr<const ScheduleSpec> spec, string* error);

  // Requests cancellation of a schedule. Idempotent. Returns false if the
  // schedule is not known.
  bool CancelSchedule(const string& schedule_name);
  void CancelAll();

  // Forwards a node event to every schedule.
  void HandleNodeEvent(const NodeID_t& node_id, NodeEventType event);

  bool GetScheduleStatus(const string& schedule_name,
                         ScheduleStatus* status) const;
  // Status of every known schedule, finished ones included, by name.
  vector<ScheduleStatus> ListSchedules() const;

  /**
   * Blocks until a schedule has finished or the timeout expires.
   * @return true if the schedule finished in time
   */
  bool WaitForSchedule(const string& schedule_name, uint64_t timeout_ms,
                       ScheduleStatus* status) const;
  // True once no known schedule is still unfinished.
  bool AllFinished() const;

  // Number of control loops whose thread still drives a schedule.
  size_t NumRunningLoops() const;

  // Stops all control loops and forgets all schedules. Schedules are not
  // drained.
  void Shutdown();

 private:
  typedef map<string, shared_ptr<ControlLoop> > LoopMap;

  shared_ptr<ControlLoop> FindLoop(const string& schedule_name) const;
  bool FindFinished(const string& schedule_name,
                    ScheduleStatus* status) const;
  // Moves loops whose schedule has finished out of loops_ and records their
  // final status. Must be called without holding schedules_lock_.
  void ReapFinishedLoops();
  static void StopLoops(const vector<shared_ptr<ControlLoop> >& loops);

  shared_ptr<NodeCatalog> node_catalog_;
  NodeAgentInterface* node_agent_;
  InstanceEventNotifierInterface* event_notifier_;
  TimeInterface* time_manager_;
  mutable boost::shared_mutex schedules_lock_;
  LoopMap loops_;
  // Final status of every finished schedule whose loop has been reaped.
  map<string, ScheduleStatus> finished_;
};

}  // namespace scheduler
}  // namespace meadow

#endif  // MEADOW_SCHEDULING_SCHEDULE_CONTROLLER_H
