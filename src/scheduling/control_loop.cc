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

// Per-schedule control loop thread.

#include "scheduling/control_loop.h"

#include <boost/bind.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

DEFINE_uint64(control_loop_tick_ms, 1000,
              "Interval at which a schedule's control loop runs an iteration "
              "if no event wakes it up earlier.");

namespace meadow {
namespace scheduler {

ControlLoop::ControlLoop(const string& name)
  : name_(name), stop_(false), retired_(false) {
  last_status_.schedule_name = name;
}

ControlLoop::~ControlLoop() {
  Stop();
}

void ControlLoop::Start(unique_ptr<ScheduleRunner> runner) {
  CHECK_NOTNULL(runner.get());
  CHECK(!thread_) << "Control loop for " << name_ << " started twice";
  runner_ = std::move(runner);
  Publish(runner_->status());
  thread_.reset(new boost::thread(boost::bind(&ControlLoop::Run, this)));
  VLOG(1) << "Control loop for schedule " << name_ << " started";
}

void ControlLoop::Stop() {
  {
    boost::lock_guard<boost::mutex> lock(queue_lock_);
    if (stop_)
      return;
    stop_ = true;
    if (!queue_.empty()) {
      VLOG(1) << "Dropping " << queue_.size() << " queued events of "
              << "schedule " << name_;
    }
    queue_.clear();
  }
  queue_cond_.notify_all();
  if (thread_ && thread_->joinable()) {
    thread_->join();
    VLOG(1) << "Control loop for schedule " << name_ << " stopped";
  }
}

void ControlLoop::Enqueue(const ScheduleEvent& event) {
  {
    boost::lock_guard<boost::mutex> lock(queue_lock_);
    if (stop_ || retired_)
      return;
    queue_.push_back(event);
  }
  queue_cond_.notify_one();
}

InstanceReportSink ControlLoop::ReportSink() {
  weak_ptr<ControlLoop> self = shared_from_this();
  return boost::bind(&ControlLoop::EnqueueReport, self, _1);
}

void ControlLoop::EnqueueReport(weak_ptr<ControlLoop> loop,
                               const InstanceReport& report) {
  shared_ptr<ControlLoop> target = loop.lock();
  if (!target) {
    VLOG(1) << "Dropping report for instance " << report.instance_id
            << " of a schedule that is gone";
    return;
  }
  target->Enqueue(ScheduleEvent::ForReport(report));
}

ScheduleStatus ControlLoop::LastStatus() const {
  boost::lock_guard<boost::mutex> lock(status_lock_);
  return last_status_;
}

bool ControlLoop::WaitUntilFinished(uint64_t timeout_ms,
                                    ScheduleStatus* status) const {
  boost::system_time deadline = boost::get_system_time() +
      boost::posix_time::milliseconds(timeout_ms);
  boost::unique_lock<boost::mutex> lock(status_lock_);
  while (!last_status_.finished) {
    if (!status_cond_.timed_wait(lock, deadline))
      break;
  }
  if (status)
    *status = last_status_;
  return last_status_.finished;
}

bool ControlLoop::running() const {
  boost::lock_guard<boost::mutex> lock(queue_lock_);
  return thread_ && !stop_ && !retired_;
}

void ControlLoop::Publish(const ScheduleStatus& status) {
  {
    boost::lock_guard<boost::mutex> lock(status_lock_);
    last_status_ = status;
  }
  status_cond_.notify_all();
}

void ControlLoop::Retire(const ScheduleStatus& final_status) {
  {
    boost::lock_guard<boost::mutex> lock(queue_lock_);
    retired_ = true;
    if (!queue_.empty()) {
      VLOG(1) << "Dropping " << queue_.size() << " events that arrived "
              << "after schedule " << name_ << " finished";
    }
    queue_.clear();
  }
  runner_.reset();
  VLOG(1) << "Control loop for schedule " << name_ << " retired";
  // Waiters see the final status only after the runner is gone.
  Publish(final_status);
}

void ControlLoop::Run() {
  ScheduleStatus status = runner_->RunIteration();
  while (!status.finished) {
    Publish(status);
    deque<ScheduleEvent> events;
    {
      boost::unique_lock<boost::mutex> lock(queue_lock_);
      if (queue_.empty() && !stop_) {
        queue_cond_.timed_wait(
            lock, boost::posix_time::milliseconds(FLAGS_control_loop_tick_ms));
      }
      if (stop_)
        return;
      events.swap(queue_);
    }
    for (const ScheduleEvent& event : events)
      runner_->HandleEvent(event);
    status = runner_->RunIteration();
    VLOG(3) << "Control loop iteration for " << name_ << " done, "
            << events.size() << " events applied";
  }
  Retire(status);
}

}  // namespace scheduler
}  // namespace meadow
