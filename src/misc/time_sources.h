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

// Clocks read by the control loops and the cluster state monitor. All
// timestamps are microseconds since the epoch.

#ifndef MEADOW_MISC_TIME_SOURCES_H
#define MEADOW_MISC_TIME_SOURCES_H

#include <boost/thread/mutex.hpp>

#include "base/common.h"

namespace meadow {

class TimeInterface {
 public:
  virtual ~TimeInterface() {}
  virtual uint64_t GetCurrentTimestamp() = 0;
};

// The system clock.
class WallTime : public TimeInterface {
 public:
  uint64_t GetCurrentTimestamp();
};

// A clock that only moves when it is told to. Heartbeat expiry, launch
// timeouts and retry backoff can then be stepped through deterministically.
// Safe to read from several threads while another one advances it.
class SimulatedTime : public TimeInterface {
 public:
  explicit SimulatedTime(uint64_t start_timestamp);
  SimulatedTime();

  uint64_t GetCurrentTimestamp();
  void SetTimestamp(uint64_t timestamp);
  void AdvanceBy(uint64_t delta);
  void AdvanceSeconds(uint64_t seconds);

 private:
  boost::mutex lock_;
  uint64_t now_;
};

}  // namespace meadow

#endif  // MEADOW_MISC_TIME_SOURCES_H
