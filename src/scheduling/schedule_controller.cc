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

// Schedule controller.

#include "scheduling/schedule_controller.h"

#include <boost/thread/locks.hpp>

namespace meadow {
namespace scheduler {

ScheduleController::ScheduleController(
    shared_ptr<NodeCatalog> node_catalog,
    NodeAgentInterface* node_agent,
    InstanceEventNotifierInterface* event_notifier,
    TimeInterface* time_manager)
  : node_catalog_(node_catalog), node_agent_(node_agent),
    event_notifier_(event_notifier), time_manager_(time_manager) {
  CHECK_NOTNULL(node_catalog_.get());
  CHECK_NOTNULL(node_agent_);
  CHECK_NOTNULL(time_manager_);
}

ScheduleController::~ScheduleController() {
  Shutdown();
}

bool ScheduleController::ActivateSchedule(shared_ptr<const ScheduleSpec> spec,
                                          string* error) {
  CHECK_NOTNULL(spec.get());
  ReapFinishedLoops();
  vector<shared_ptr<ControlLoop> > replaced;
  shared_ptr<ControlLoop> loop(new ControlLoop(spec->name()));
  unique_ptr<ScheduleRunner> runner(
      new ScheduleRunner(spec, node_catalog_, node_agent_, event_notifier_,
                         time_manager_, loop->ReportSink()));
  {
    boost::unique_lock<boost::shared_mutex> lock(schedules_lock_);
    LoopMap::iterator it = loops_.find(spec->name());
    if (it != loops_.end()) {
      // The old loop may have finished since it was last reaped.
      if (!it->second->LastStatus().finished) {
        if (error)
          *error = "schedule " + spec->name() + " is already active";
        return false;
      }
      replaced.push_back(it->second);
    }
    finished_.erase(spec->name());
    loops_[spec->name()] = loop;
  }
  // Joining the old loop's thread happens outside the lock.
  StopLoops(replaced);
  LOG(INFO) << "Activating schedule " << spec->name() << " ("
            << ScheduleDescriptor::AllocationMode_Name(spec->allocation_mode())
            << " on " << ScheduleDescriptor::BalancingMetric_Name(
                spec->metric())
            << ", " << spec->ActiveComponents().size() << " of "
            << spec->components().size() << " components active)";
  loop->Start(std::move(runner));
  return true;
}

bool ScheduleController::UpdateSchedule(shared_ptr<const ScheduleSpec> spec,
                                        string* error) {
  CHECK_NOTNULL(spec.get());
  ReapFinishedLoops();
  shared_ptr<ControlLoop> loop = FindLoop(spec->name());
  if (!loop) {
    if (error) {
      ScheduleStatus status;
      *error = "schedule " + spec->name() +
          (FindFinished(spec->name(), &status) ? " is no longer running"
                                                : " is not known");
    }
    return false;
  }
  ScheduleStatus status = loop->LastStatus();
  if (status.finished || status.cancel_requested) {
    if (error)
      *error = "schedule " + spec->name() + " is no longer running";
    return false;
  }
  loop->Enqueue(ScheduleEvent::ForSpec(spec));
  return true;
}

bool ScheduleController::CancelSchedule(const string& schedule_name) {
  ReapFinishedLoops();
  shared_ptr<ControlLoop> loop = FindLoop(schedule_name);
  if (loop) {
    loop->Enqueue(ScheduleEvent::Cancel());
    return true;
  }
  ScheduleStatus status;
  if (FindFinished(schedule_name, &status)) {
    VLOG(1) << "Schedule " << schedule_name << " already finished";
    return true;
  }
  LOG(WARNING) << "Cannot cancel unknown schedule " << schedule_name;
  return false;
}

void ScheduleController::CancelAll() {
  ReapFinishedLoops();
  boost::shared_lock<boost::shared_mutex> lock(schedules_lock_);
  LOG(INFO) << "Cancelling all " << loops_.size() << " running schedules";
  for (const auto& name_loop : loops_)
    name_loop.second->Enqueue(ScheduleEvent::Cancel());
}

void ScheduleController::HandleNodeEvent(const NodeID_t& node_id,
                                         NodeEventType event) {
  ReapFinishedLoops();
  boost::shared_lock<boost::shared_mutex> lock(schedules_lock_);
  VLOG(1) << "Node " << node_id << " " << NodeEventTypeToString(event)
          << ", notifying " << loops_.size() << " schedules";
  for (const auto& name_loop : loops_)
    name_loop.second->Enqueue(ScheduleEvent::ForNode(node_id, event));
}

bool ScheduleController::GetScheduleStatus(const string& schedule_name,
                                           ScheduleStatus* status) const {
  CHECK_NOTNULL(status);
  shared_ptr<ControlLoop> loop = FindLoop(schedule_name);
  if (loop) {
    *status = loop->LastStatus();
    return true;
  }
  return FindFinished(schedule_name, status);
}

vector<ScheduleStatus> ScheduleController::ListSchedules() const {
  boost::shared_lock<boost::shared_mutex> lock(schedules_lock_);
  map<string, ScheduleStatus> statuses(finished_);
  for (const auto& name_loop : loops_)
    statuses[name_loop.first] = name_loop.second->LastStatus();
  vector<ScheduleStatus> result;
  for (const auto& name_status : statuses)
    result.push_back(name_status.second);
  return result;
}

bool ScheduleController::WaitForSchedule(const string& schedule_name,
                                         uint64_t timeout_ms,
                                         ScheduleStatus* status) const {
  shared_ptr<ControlLoop> loop = FindLoop(schedule_name);
  if (loop)
    return loop->WaitUntilFinished(timeout_ms, status);
  ScheduleStatus final_status;
  if (!FindFinished(schedule_name, &final_status))
    return false;
  if (status)
    *status = final_status;
  return true;
}

bool ScheduleController::AllFinished() const {
  boost::shared_lock<boost::shared_mutex> lock(schedules_lock_);
  for (const auto& name_loop : loops_) {
    if (!name_loop.second->LastStatus().finished)
      return false;
  }
  return true;
}

size_t ScheduleController::NumRunningLoops() const {
  boost::shared_lock<boost::shared_mutex> lock(schedules_lock_);
  size_t running = 0;
  for (const auto& name_loop : loops_) {
    if (name_loop.second->running())
      running++;
  }
  return running;
}

void ScheduleController::Shutdown() {
  vector<shared_ptr<ControlLoop> > loops;
  {
    boost::unique_lock<boost::shared_mutex> lock(schedules_lock_);
    for (const auto& name_loop : loops_)
      loops.push_back(name_loop.second);
    loops_.clear();
    finished_.clear();
  }
  if (!loops.empty()) {
    LOG(INFO) << "Stopping " << loops.size() << " control loops";
  }
  StopLoops(loops);
}

void ScheduleController::ReapFinishedLoops() {
  vector<shared_ptr<ControlLoop> > reaped;
  {
    boost::unique_lock<boost::shared_mutex> lock(schedules_lock_);
    for (LoopMap::iterator it = loops_.begin(); it != loops_.end();) {
      ScheduleStatus status = it->second->LastStatus();
      if (!status.finished) {
        ++it;
        continue;
      }
      finished_[it->first] = status;
      reaped.push_back(it->second);
      loops_.erase(it++);
    }
  }
  if (!reaped.empty())
    VLOG(1) << "Disposing of " << reaped.size() << " finished control loops";
  StopLoops(reaped);
}

void ScheduleController::StopLoops(
    const vector<shared_ptr<ControlLoop> >& loops) {
  // The loop threads call into the node agent; they have to be gone before
  // the last reference to a loop is dropped.
  for (const shared_ptr<ControlLoop>& loop : loops)
    loop->Stop();
}

shared_ptr<ControlLoop> ScheduleController::FindLoop(
    const string& schedule_name) const {
  boost::shared_lock<boost::shared_mutex> lock(schedules_lock_);
  LoopMap::const_iterator it = loops_.find(schedule_name);
  if (it == loops_.end())
    return shared_ptr<ControlLoop>();
  return it->second;
}

bool ScheduleController::FindFinished(const string& schedule_name,
                                      ScheduleStatus* status) const {
  boost::shared_lock<boost::shared_mutex> lock(schedules_lock_);
  map<string, ScheduleStatus>::const_iterator it =
    finished_.find(schedule_name);
  if (it == finished_.end())
    return false;
  *status = it->second;
  return true;
}

}  // namespace scheduler
}  // namespace meadow
