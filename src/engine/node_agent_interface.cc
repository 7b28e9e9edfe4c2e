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

#include "engine/node_agent_interface.h"

namespace meadow {
namespace agent {

const char* AgentResultTypeToString(AgentResult::ResultType type) {
  switch (type) {
    case AgentResult::STARTED:
      return "started";
    case AgentResult::EXITED_OK:
      return "exited-ok";
    case AgentResult::EXITED_ERROR:
      return "exited-error";
    case AgentResult::CRASHED:
      return "crashed";
    case AgentResult::LAUNCH_FAILED:
      return "launch-failed";
    case AgentResult::AGENT_UNREACHABLE:
      return "agent-unreachable";
    case AgentResult::KILLED:
      return "killed";
    case AgentResult::KILL_FAILED:
      return "kill-failed";
  }
  return "unknown";
}

ostream& operator<<(ostream& stream, const NodeAgentInterface& agent) {
  return stream << "<" << agent.Describe() << ">";
}

}  // namespace agent
}  // namespace meadow
