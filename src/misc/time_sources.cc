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

// Wall clock and simulated clock.

#include "misc/time_sources.h"

#include <boost/date_time/posix_time/posix_time.hpp>

#include "base/units.h"

namespace meadow {

uint64_t WallTime::GetCurrentTimestamp() {
  static const boost::posix_time::ptime epoch(
      boost::gregorian::date(1970, 1, 1));
  boost::posix_time::time_duration since_epoch =
      boost::posix_time::microsec_clock::universal_time() - epoch;
  return static_cast<uint64_t>(since_epoch.total_microseconds());
}

SimulatedTime::SimulatedTime(uint64_t start_timestamp)
  : now_(start_timestamp) {
}

SimulatedTime::SimulatedTime() : now_(0) {
}

uint64_t SimulatedTime::GetCurrentTimestamp() {
  boost::lock_guard<boost::mutex> lock(lock_);
  return now_;
}

void SimulatedTime::SetTimestamp(uint64_t timestamp) {
  boost::lock_guard<boost::mutex> lock(lock_);
  if (timestamp < now_) {
    LOG(WARNING) << "Simulated clock moved backwards from " << now_ << " to "
                 << timestamp;
  }
  now_ = timestamp;
}

void SimulatedTime::AdvanceBy(uint64_t delta) {
  boost::lock_guard<boost::mutex> lock(lock_);
  now_ += delta;
}

void SimulatedTime::AdvanceSeconds(uint64_t seconds) {
  AdvanceBy(seconds * MICROSECONDS_IN_SECOND);
}

}  // namespace meadow
