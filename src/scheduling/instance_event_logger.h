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

// Instance event sink that writes every event to the log and, optionally, to
// an event trace file in ASCII format, one line per event:
// <timestamp> <schedule> <instance id> <component> <node> <old> <new> <reason>
// Several control loops may share one logger.

#ifndef MEADOW_SCHEDULING_INSTANCE_EVENT_LOGGER_H
#define MEADOW_SCHEDULING_INSTANCE_EVENT_LOGGER_H

#include <fstream>  // NOLINT
#include <string>

#include <boost/thread/mutex.hpp>

#include "base/common.h"
#include "scheduling/instance_event_notifier_interface.h"

namespace meadow {
namespace scheduler {

class InstanceEventLogger : public InstanceEventNotifierInterface {
 public:
  // Logs to the file named by --instance_event_log, if any.
  InstanceEventLogger();
  // Logs to out_filename; an empty name disables the trace file.
  explicit InstanceEventLogger(const string& out_filename);
  virtual ~InstanceEventLogger();

  void OnInstanceEvent(const InstanceEvent& event);

  uint64_t num_events() const;
  // Formats an event the way it is written to the trace file.
  static string FormatEvent(const InstanceEvent& event);

 private:
  void OpenTrace(const string& out_filename);

  mutable boost::mutex lock_;
  ofstream* buffer_;
  uint64_t num_events_;
};

}  // namespace scheduler
}  // namespace meadow

#endif  // MEADOW_SCHEDULING_INSTANCE_EVENT_LOGGER_H
