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

// Common static data structures and methods.

#ifndef MEADOW_BASE_COMMON_H
#define MEADOW_BASE_COMMON_H

#include <stdint.h>

#include <sstream>  // NOLINT
#include <vector>
#include <set>
#include <string>

#include <glog/logging.h>
#include <gflags/gflags.h>

namespace meadow {

using namespace std;  // NOLINT

// Helper function to convert an arbitrary object to a string via the
// stringstream standard library class.
template <class T> inline string to_string(const T& t) {
  stringstream ss;
  ss << t;
  return ss.str();
}

namespace common {

// Helper function to perform common init tasks for user-facing Meadow
// binaries.
inline void InitMeadow(int argc, char *argv[]) {
  // Use gflags to parse command line flags. Parsed flags are removed from
  // argv, so that the remainder can be treated as positional arguments.
  google::ParseCommandLineFlags(&argc, &argv, true);

  // Set up glog for logging output
  google::InitGoogleLogging(argv[0]);
}

}  // namespace common
}  // namespace meadow

#endif  // MEADOW_BASE_COMMON_H
