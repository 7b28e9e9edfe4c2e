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

// Instance event logger.

#include "scheduling/instance_event_logger.h"

#include "misc/utils.h"

DEFINE_string(instance_event_log, "",
              "File to append instance state transitions to. Empty to "
              "disable the trace.");

namespace meadow {
namespace scheduler {

InstanceEventLogger::InstanceEventLogger()
  : buffer_(NULL), num_events_(0) {
  OpenTrace(FLAGS_instance_event_log);
}

InstanceEventLogger::InstanceEventLogger(const string& out_filename)
  : buffer_(NULL), num_events_(0) {
  OpenTrace(out_filename);
}

InstanceEventLogger::~InstanceEventLogger() {
  if (buffer_) {
    buffer_->close();
    delete buffer_;
  }
}

void InstanceEventLogger::OpenTrace(const string& out_filename) {
  if (out_filename.empty())
    return;
  buffer_ = new ofstream(out_filename.c_str(), ios::out | ios::app);
  if (!buffer_->is_open()) {
    LOG(ERROR) << "Failed to open instance event log " << out_filename
               << "; events will only go to the log";
    delete buffer_;
    buffer_ = NULL;
    return;
  }
  LOG(INFO) << "InstanceEventLogger writing to " << out_filename;
}

string InstanceEventLogger::FormatEvent(const InstanceEvent& event) {
  string node = event.node_id().empty() ? "-" : event.node_id();
  string reason = event.reason().empty() ? "-" : event.reason();
  return to_string(event.timestamp()) + " " + event.schedule_name() + " " +
      to_string(event.instance_id()) + " " + event.component_name() + " " +
      node + " " + InstanceStateToString(event.old_state()) + " " +
      InstanceStateToString(event.new_state()) + " " + reason;
}

uint64_t InstanceEventLogger::num_events() const {
  boost::lock_guard<boost::mutex> lock(lock_);
  return num_events_;
}

void InstanceEventLogger::OnInstanceEvent(const InstanceEvent& event) {
  if (event.new_state() == InstanceDescriptor::FAILED ||
      (event.new_state() == InstanceDescriptor::TERMINATED &&
       !event.reason().empty())) {
    LOG(WARNING) << "Instance " << event.instance_id() << " ("
                 << event.schedule_name() << "/" << event.component_name()
                 << ") " << InstanceStateToString(event.old_state()) << " -> "
                 << InstanceStateToString(event.new_state()) << ": "
                 << event.reason();
  } else {
    VLOG(1) << "Instance " << event.instance_id() << " ("
            << event.schedule_name() << "/" << event.component_name()
            << ") " << InstanceStateToString(event.old_state()) << " -> "
            << InstanceStateToString(event.new_state())
            << (event.node_id().empty() ? "" : " on " + event.node_id());
  }
  boost::lock_guard<boost::mutex> lock(lock_);
  ++num_events_;
  if (buffer_)
    *buffer_ << FormatEvent(event) << endl;
}

}  // namespace scheduler
}  // namespace meadow
