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

// Failure taxonomy shared by the scheduling components.

#ifndef MEADOW_BASE_ERRORS_H
#define MEADOW_BASE_ERRORS_H

#include <stdexcept>
#include <string>

namespace meadow {

// Failure kinds that can hold up a component. All but INVARIANT_VIOLATION are
// recoverable and handled by retrying.
enum FailureKind {
  INFEASIBLE_PLACEMENT = 0,
  INSUFFICIENT_CAPACITY = 1,
  LAUNCH_FAILURE = 2,
  AGENT_UNREACHABLE = 3,
  INVARIANT_VIOLATION = 4,
};

inline const char* FailureKindToString(FailureKind kind) {
  switch (kind) {
    case INFEASIBLE_PLACEMENT:
      return "InfeasiblePlacement";
    case INSUFFICIENT_CAPACITY:
      return "InsufficientCapacity";
    case LAUNCH_FAILURE:
      return "LaunchFailure";
    case AGENT_UNREACHABLE:
      return "AgentUnreachable";
    case INVARIANT_VIOLATION:
      return "InvariantViolation";
  }
  return "Unknown";
}

// Raised when internal bookkeeping would become inconsistent, e.g. negative
// free capacity or a duplicate instance id. This indicates a bug; the owning
// control loop catches it and freezes its schedule.
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& what)
    : std::logic_error(what) {}
};

}  // namespace meadow

#endif  // MEADOW_BASE_ERRORS_H
