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

// The node agent interface assumed by the instance supervisor. A node agent
// starts and stops instances on a node; how it does so (containers, processes,
// a remote daemon) is up to the implementation.

#ifndef MEADOW_ENGINE_NODE_AGENT_INTERFACE_H
#define MEADOW_ENGINE_NODE_AGENT_INTERFACE_H

#include <string>

#include <boost/function.hpp>

#include "base/common.h"
#include "base/resource_vector.h"
#include "base/types.h"

namespace meadow {
namespace agent {

// Everything a node needs to start one instance.
struct LaunchCommand {
  string schedule_name;
  string component_name;
  string image;
  string command;
  string mount_target;
};

struct AgentResult {
  enum ResultType {
    STARTED = 0,
    EXITED_OK = 1,
    EXITED_ERROR = 2,
    CRASHED = 3,
    LAUNCH_FAILED = 4,
    AGENT_UNREACHABLE = 5,
    KILLED = 6,
    KILL_FAILED = 7,
  };

  AgentResult() : type(STARTED) {}
  AgentResult(ResultType t, const string& r) : type(t), reason(r) {}

  ResultType type;
  string reason;
};

const char* AgentResultTypeToString(AgentResult::ResultType type);

typedef boost::function<void(const AgentResult&)> AgentResultCallback;

class NodeAgentInterface {
 public:
  virtual ~NodeAgentInterface() {}

  /**
   * Starts an instance on a node. Returns without waiting for the outcome.
   * The callback is invoked with STARTED, LAUNCH_FAILED or AGENT_UNREACHABLE
   * once the outcome is known and, for a started instance, again with
   * EXITED_OK, EXITED_ERROR or CRASHED when it exits. It may be invoked from
   * any thread, including the caller's, and must not block.
   * @param node_id the node to start the instance on
   * @param instance_id the id of the instance
   * @param command what to run
   * @param resource_request the resources reserved for the instance
   * @param done the result callback
   */
  virtual void Launch(const NodeID_t& node_id,
                      InstanceID_t instance_id,
                      const LaunchCommand& command,
                      const ResourceVector& resource_request,
                      AgentResultCallback done) = 0;

  /**
   * Stops an instance. The callback is invoked with KILLED or KILL_FAILED,
   * under the same threading rules as for Launch.
   * @param node_id the node the instance runs on
   * @param instance_id the id of the instance to stop
   * @param done the result callback
   */
  virtual void Kill(const NodeID_t& node_id,
                    InstanceID_t instance_id,
                    AgentResultCallback done) = 0;

  // One-line description of the agent for log messages.
  virtual string Describe() const = 0;
};

ostream& operator<<(ostream& stream, const NodeAgentInterface& agent);

}  // namespace agent
}  // namespace meadow

#endif  // MEADOW_ENGINE_NODE_AGENT_INTERFACE_H
