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

// Cluster-wide capacity bookkeeping.

#include "scheduling/node_catalog.h"

#include <map>
#include <string>
#include <vector>

#include <boost/thread/locks.hpp>

#include "base/errors.h"
#include "misc/utils.h"

namespace meadow {
namespace scheduler {

const char* CatalogStatusToString(CatalogStatus status) {
  switch (status) {
    case CATALOG_OK:
      return "ok";
    case CATALOG_INSUFFICIENT_CAPACITY:
      return "insufficient capacity";
    case CATALOG_NODE_NOT_FOUND:
      return "node not found";
    case CATALOG_NODE_NOT_READY:
      return "node not ready";
  }
  return "unknown";
}

const char* NodeEventTypeToString(NodeEventType type) {
  switch (type) {
    case NODE_EVENT_READY:
      return "ready";
    case NODE_EVENT_DRAINING:
      return "draining";
    case NODE_EVENT_UNREACHABLE:
      return "unreachable";
    case NODE_EVENT_REMOVED:
      return "removed";
  }
  return "unknown";
}

NodeCatalog::NodeCatalog() : next_incarnation_(1) {
}

bool NodeCatalog::UpsertNode(const NodeID_t& node_id,
                             const ResourceVector& capacity) {
  {
    boost::shared_lock<boost::shared_mutex> map_lock(membership_lock_);
    map<NodeID_t, shared_ptr<NodeEntry> >::const_iterator it =
      nodes_.find(node_id);
    if (it != nodes_.end()) {
      NodeEntry* entry = it->second.get();
      boost::lock_guard<boost::mutex> node_lock(entry->lock);
      if (entry->allocated.FitsIn(capacity)) {
        entry->total_capacity = capacity;
      } else {
        LOG(WARNING) << "Ignoring capacity " << capacity << " for node "
                     << node_id << ", which has " << entry->allocated
                     << " allocated";
      }
      if (entry->status == NodeDescriptor::NODE_UNREACHABLE)
        entry->status = NodeDescriptor::NODE_READY;
      return false;
    }
  }
  boost::unique_lock<boost::shared_mutex> map_lock(membership_lock_);
  // Another thread may have registered the node in the meantime.
  if (nodes_.find(node_id) != nodes_.end())
    return false;
  VLOG(1) << "Adding node " << node_id << " with capacity " << capacity;
  nodes_[node_id] =
    shared_ptr<NodeEntry>(new NodeEntry(capacity, next_incarnation_++));
  return true;
}

CatalogStatus NodeCatalog::MarkUnreachable(const NodeID_t& node_id) {
  return SetStatus(node_id, NodeDescriptor::NODE_UNREACHABLE);
}

CatalogStatus NodeCatalog::MarkDraining(const NodeID_t& node_id) {
  return SetStatus(node_id, NodeDescriptor::NODE_DRAINING);
}

CatalogStatus NodeCatalog::MarkReady(const NodeID_t& node_id) {
  return SetStatus(node_id, NodeDescriptor::NODE_READY);
}

CatalogStatus NodeCatalog::RemoveNode(const NodeID_t& node_id) {
  boost::unique_lock<boost::shared_mutex> map_lock(membership_lock_);
  map<NodeID_t, shared_ptr<NodeEntry> >::iterator it = nodes_.find(node_id);
  if (it == nodes_.end())
    return CATALOG_NODE_NOT_FOUND;
  VLOG(1) << "Removing node " << node_id;
  nodes_.erase(it);
  return CATALOG_OK;
}

CatalogStatus NodeCatalog::Reserve(const NodeID_t& node_id,
                                   const ResourceVector& amount,
                                   uint64_t* incarnation) {
  shared_ptr<NodeEntry> entry = FindEntry(node_id);
  if (!entry)
    return CATALOG_NODE_NOT_FOUND;
  boost::lock_guard<boost::mutex> node_lock(entry->lock);
  if (entry->status != NodeDescriptor::NODE_READY)
    return CATALOG_NODE_NOT_READY;
  ResourceVector free = entry->total_capacity - entry->allocated;
  if (!Fits(amount, free)) {
    VLOG(1) << "Cannot reserve " << amount << " on node " << node_id
            << ", which only has " << free << " free";
    return CATALOG_INSUFFICIENT_CAPACITY;
  }
  entry->allocated = entry->allocated + amount;
  if (incarnation)
    *incarnation = entry->incarnation;
  VLOG(2) << "Reserved " << amount << " on node " << node_id;
  return CATALOG_OK;
}

CatalogStatus NodeCatalog::Release(const NodeID_t& node_id,
                                   const ResourceVector& amount,
                                   uint64_t incarnation) {
  shared_ptr<NodeEntry> entry = FindEntry(node_id);
  if (!entry || entry->incarnation != incarnation)
    return CATALOG_NODE_NOT_FOUND;
  boost::lock_guard<boost::mutex> node_lock(entry->lock);
  if (!amount.FitsIn(entry->allocated)) {
    throw InvariantViolation("releasing " + amount.DebugString() +
                             " from node " + node_id + ", which only has " +
                             entry->allocated.DebugString() + " allocated");
  }
  entry->allocated = entry->allocated - amount;
  VLOG(2) << "Released " << amount << " on node " << node_id;
  return CATALOG_OK;
}

vector<NodeState> NodeCatalog::Snapshot() const {
  vector<NodeState> snapshot;
  boost::shared_lock<boost::shared_mutex> map_lock(membership_lock_);
  snapshot.reserve(nodes_.size());
  for (map<NodeID_t, shared_ptr<NodeEntry> >::const_iterator it =
       nodes_.begin();
       it != nodes_.end();
       ++it) {
    NodeState node;
    node.node_id = it->first;
    boost::lock_guard<boost::mutex> node_lock(it->second->lock);
    node.total_capacity = it->second->total_capacity;
    node.allocated = it->second->allocated;
    node.status = it->second->status;
    node.incarnation = it->second->incarnation;
    snapshot.push_back(node);
  }
  return snapshot;
}

bool NodeCatalog::GetNode(const NodeID_t& node_id, NodeState* node) const {
  CHECK_NOTNULL(node);
  shared_ptr<NodeEntry> entry = FindEntry(node_id);
  if (!entry)
    return false;
  boost::lock_guard<boost::mutex> node_lock(entry->lock);
  node->node_id = node_id;
  node->total_capacity = entry->total_capacity;
  node->allocated = entry->allocated;
  node->status = entry->status;
  node->incarnation = entry->incarnation;
  return true;
}

size_t NodeCatalog::NumNodes() const {
  boost::shared_lock<boost::shared_mutex> map_lock(membership_lock_);
  return nodes_.size();
}

shared_ptr<NodeCatalog::NodeEntry> NodeCatalog::FindEntry(
    const NodeID_t& node_id) const {
  boost::shared_lock<boost::shared_mutex> map_lock(membership_lock_);
  map<NodeID_t, shared_ptr<NodeEntry> >::const_iterator it =
    nodes_.find(node_id);
  if (it == nodes_.end())
    return shared_ptr<NodeEntry>();
  return it->second;
}

CatalogStatus NodeCatalog::SetStatus(const NodeID_t& node_id,
                                     NodeDescriptor::NodeStatus status) {
  shared_ptr<NodeEntry> entry = FindEntry(node_id);
  if (!entry)
    return CATALOG_NODE_NOT_FOUND;
  boost::lock_guard<boost::mutex> node_lock(entry->lock);
  if (entry->status != status) {
    VLOG(1) << "Node " << node_id << " is now "
            << NodeStatusToString(status);
    entry->status = status;
  }
  return CATALOG_OK;
}

}  // namespace scheduler
}  // namespace meadow
