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

// Cluster state monitor. Consumes node heartbeats and operator requests,
// keeps the node catalog up to date and reports node lifecycle changes to a
// listener (normally the schedule controller). A periodic check, run either
// by the caller or by the monitor's own Run() loop, marks nodes whose
// heartbeats stopped as unreachable.

#ifndef MEADOW_SCHEDULING_CLUSTER_STATE_MONITOR_H
#define MEADOW_SCHEDULING_CLUSTER_STATE_MONITOR_H

#include <map>
#include <string>
#include <vector>

#include <boost/function.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>

#include "base/common.h"
#include "base/node_desc.pb.h"
#include "base/types.h"
#include "misc/time_sources.h"
#include "scheduling/node_catalog.h"

namespace meadow {
namespace scheduler {

typedef boost::function<void(const NodeID_t&, NodeEventType)>
    NodeEventCallback;

class ClusterStateMonitor {
 public:
  ClusterStateMonitor(shared_ptr<NodeCatalog> node_catalog,
                      TimeInterface* time_manager,
                      NodeEventCallback node_event_callback);

  /**
   * Processes a heartbeat. The first heartbeat of a node registers it; later
   * ones refresh its capacity and bring it back if it was unreachable.
   * @param nd the heartbeat; a zero last_heartbeat means "now"
   * @return false if the heartbeat is malformed
   */
  bool HandleHeartbeat(const NodeDescriptor& nd);
  // Stops new placements on a node; resident instances stay.
  bool Drain(const NodeID_t& node_id);
  // Removes a node from the cluster.
  bool Decommission(const NodeID_t& node_id);

  // Marks nodes unreachable whose last heartbeat is older than
  // --node_heartbeat_timeout_ms. Returns how many were marked.
  uint64_t CheckHeartbeats();

  // Runs CheckHeartbeats() every --cluster_state_check_interval_ms until
  // Stop() is called.
  void Run();
  void Stop();

  // Known nodes, in ascending node id order.
  vector<NodeDescriptor> ListNodes() const;

 private:
  void Notify(const NodeID_t& node_id, NodeEventType event);

  shared_ptr<NodeCatalog> node_catalog_;
  TimeInterface* time_manager_;
  NodeEventCallback node_event_callback_;
  mutable boost::mutex lock_;
  boost::condition_variable stop_cond_;
  map<NodeID_t, NodeDescriptor> nodes_;
  bool stop_;
};

}  // namespace scheduler
}  // namespace meadow

#endif  // MEADOW_SCHEDULING_CLUSTER_STATE_MONITOR_H
