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

// Cluster state monitor.

#include "scheduling/cluster_state_monitor.h"

#include <boost/date_time/posix_time/posix_time.hpp>

#include "base/resource_vector.h"
#include "base/units.h"

DEFINE_uint64(node_heartbeat_timeout_ms, 15000,
              "Time without a heartbeat after which a node is considered "
              "unreachable.");
DEFINE_uint64(cluster_state_check_interval_ms, 1000,
              "Interval at which node heartbeats are checked.");

namespace meadow {
namespace scheduler {

ClusterStateMonitor::ClusterStateMonitor(
    shared_ptr<NodeCatalog> node_catalog,
    TimeInterface* time_manager,
    NodeEventCallback node_event_callback)
  : node_catalog_(node_catalog), time_manager_(time_manager),
    node_event_callback_(node_event_callback), stop_(false) {
  CHECK_NOTNULL(node_catalog_.get());
  CHECK_NOTNULL(time_manager_);
}

bool ClusterStateMonitor::HandleHeartbeat(const NodeDescriptor& nd) {
  if (nd.node_id().empty()) {
    LOG(WARNING) << "Ignoring heartbeat without a node id from "
                 << nd.hostname();
    return false;
  }
  ResourceVector capacity(nd.capacity());
  NodeState previous;
  bool known = node_catalog_->GetNode(nd.node_id(), &previous);
  bool added = node_catalog_->UpsertNode(nd.node_id(), capacity);
  NodeState current;
  if (!node_catalog_->GetNode(nd.node_id(), &current)) {
    // Decommissioned concurrently.
    return false;
  }
  {
    boost::lock_guard<boost::mutex> lock(lock_);
    NodeDescriptor* record = &nodes_[nd.node_id()];
    record->CopyFrom(nd);
    if (record->last_heartbeat() == 0)
      record->set_last_heartbeat(time_manager_->GetCurrentTimestamp());
    record->set_status(current.status);
    capacity.ToProtobuf(record->mutable_capacity());
  }
  if (added) {
    LOG(INFO) << "Node " << nd.node_id() << " (" << nd.hostname()
              << ") joined with capacity " << capacity;
    Notify(nd.node_id(), NODE_EVENT_READY);
  } else if (known && previous.status == NodeDescriptor::NODE_UNREACHABLE &&
             current.status == NodeDescriptor::NODE_READY) {
    LOG(INFO) << "Node " << nd.node_id() << " is reachable again";
    Notify(nd.node_id(), NODE_EVENT_READY);
  }
  return true;
}

bool ClusterStateMonitor::Drain(const NodeID_t& node_id) {
  CatalogStatus status = node_catalog_->MarkDraining(node_id);
  if (status != CATALOG_OK) {
    LOG(WARNING) << "Cannot drain node " << node_id << ": "
                 << CatalogStatusToString(status);
    return false;
  }
  {
    boost::lock_guard<boost::mutex> lock(lock_);
    map<NodeID_t, NodeDescriptor>::iterator it = nodes_.find(node_id);
    if (it != nodes_.end())
      it->second.set_status(NodeDescriptor::NODE_DRAINING);
  }
  LOG(INFO) << "Draining node " << node_id;
  Notify(node_id, NODE_EVENT_DRAINING);
  return true;
}

bool ClusterStateMonitor::Decommission(const NodeID_t& node_id) {
  CatalogStatus status = node_catalog_->RemoveNode(node_id);
  {
    boost::lock_guard<boost::mutex> lock(lock_);
    nodes_.erase(node_id);
  }
  if (status != CATALOG_OK) {
    LOG(WARNING) << "Cannot decommission node " << node_id << ": "
                 << CatalogStatusToString(status);
    return false;
  }
  LOG(INFO) << "Decommissioned node " << node_id;
  Notify(node_id, NODE_EVENT_REMOVED);
  return true;
}

uint64_t ClusterStateMonitor::CheckHeartbeats() {
  uint64_t now = time_manager_->GetCurrentTimestamp();
  uint64_t timeout =
    FLAGS_node_heartbeat_timeout_ms * MILLISECONDS_TO_MICROSECONDS;
  vector<NodeID_t> lost;
  {
    boost::lock_guard<boost::mutex> lock(lock_);
    for (auto& id_node : nodes_) {
      NodeDescriptor* nd = &id_node.second;
      if (nd->status() == NodeDescriptor::NODE_UNREACHABLE)
        continue;
      if (now > nd->last_heartbeat() && now - nd->last_heartbeat() > timeout) {
        nd->set_status(NodeDescriptor::NODE_UNREACHABLE);
        lost.push_back(id_node.first);
      }
    }
  }
  for (const NodeID_t& node_id : lost) {
    if (node_catalog_->MarkUnreachable(node_id) != CATALOG_OK)
      continue;
    LOG(WARNING) << "Node " << node_id << " missed its heartbeats for more "
                 << "than " << FLAGS_node_heartbeat_timeout_ms << "ms; "
                 << "marking it unreachable";
    Notify(node_id, NODE_EVENT_UNREACHABLE);
  }
  return lost.size();
}

void ClusterStateMonitor::Run() {
  VLOG(1) << "Cluster state monitor running";
  boost::unique_lock<boost::mutex> lock(lock_);
  while (!stop_) {
    stop_cond_.timed_wait(lock, boost::posix_time::milliseconds(
        FLAGS_cluster_state_check_interval_ms));
    if (stop_)
      break;
    lock.unlock();
    VLOG(2) << "Cluster state monitor checking heartbeats";
    CheckHeartbeats();
    lock.lock();
  }
  VLOG(1) << "Cluster state monitor stopped";
}

void ClusterStateMonitor::Stop() {
  {
    boost::lock_guard<boost::mutex> lock(lock_);
    stop_ = true;
  }
  stop_cond_.notify_all();
}

vector<NodeDescriptor> ClusterStateMonitor::ListNodes() const {
  boost::lock_guard<boost::mutex> lock(lock_);
  vector<NodeDescriptor> nodes;
  for (const auto& id_node : nodes_)
    nodes.push_back(id_node.second);
  return nodes;
}

void ClusterStateMonitor::Notify(const NodeID_t& node_id,
                                 NodeEventType event) {
  VLOG(1) << "Node event: " << node_id << " " << NodeEventTypeToString(event);
  if (node_event_callback_)
    node_event_callback_(node_id, event);
}

}  // namespace scheduler
}  // namespace meadow
