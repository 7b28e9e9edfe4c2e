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

// A control loop runs one schedule on its own thread. Events are queued in
// FIFO order and applied one at a time; the loop wakes up when an event
// arrives or when the tick interval (--control_loop_tick_ms) elapses,
// whichever comes first, and then runs one iteration of its schedule runner.
// Once the schedule has finished, the loop disposes of its runner and its
// thread exits; only the final status is kept.

#ifndef MEADOW_SCHEDULING_CONTROL_LOOP_H
#define MEADOW_SCHEDULING_CONTROL_LOOP_H

#include <deque>
#include <string>

#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>

#include "base/common.h"
#include "base/types.h"
#include "scheduling/instance_supervisor.h"
#include "scheduling/schedule_runner.h"

namespace meadow {
namespace scheduler {

class ControlLoop : public enable_shared_from_this<ControlLoop> {
 public:
  explicit ControlLoop(const string& name);
  ~ControlLoop();

  /**
   * Starts the loop thread.
   * @param runner the runner to drive; the loop takes ownership and destroys
   * it on its own thread when the schedule finishes
   */
  void Start(unique_ptr<ScheduleRunner> runner);
  // Stops the loop and waits for its thread to exit. Queued events that have
  // not been applied yet are dropped. Also joins the thread of a retired loop.
  void Stop();
  // Events for a stopped or retired loop are dropped.
  void Enqueue(const ScheduleEvent& event);

  /**
   * Returns a sink that feeds agent reports into this loop. The sink holds
   * only a weak reference, so reports arriving after the loop has gone away
   * are dropped. The loop must be owned by a shared_ptr.
   */
  InstanceReportSink ReportSink();

  // The status published after the most recent iteration.
  ScheduleStatus LastStatus() const;

  /**
   * Waits until the schedule has finished.
   * @param timeout_ms how long to wait at most
   * @param status if not NULL, set to the last published status
   * @return true if the schedule finished within the timeout
   */
  bool WaitUntilFinished(uint64_t timeout_ms, ScheduleStatus* status) const;

  inline const string& name() const { return name_; }
  // False once the loop was stopped or has retired after its schedule
  // finished.
  bool running() const;

 private:
  static void EnqueueReport(weak_ptr<ControlLoop> loop,
                            const InstanceReport& report);
  void Publish(const ScheduleStatus& status);
  void Retire(const ScheduleStatus& final_status);
  void Run();

  const string name_;
  unique_ptr<ScheduleRunner> runner_;
  unique_ptr<boost::thread> thread_;
  mutable boost::mutex queue_lock_;
  boost::condition_variable queue_cond_;
  deque<ScheduleEvent> queue_;
  bool stop_;
  bool retired_;
  mutable boost::mutex status_lock_;
  mutable boost::condition_variable status_cond_;
  ScheduleStatus last_status_;
};

}  // namespace scheduler
}  // namespace meadow

#endif  // MEADOW_SCHEDULING_CONTROL_LOOP_H
