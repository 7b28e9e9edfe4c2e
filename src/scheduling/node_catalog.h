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

// Cluster-wide capacity bookkeeping. The catalog is shared by the control
// loops of all schedules. Membership changes take the catalog lock
// exclusively; reserve/release only take it shared plus the lock of the node
// they touch, so that loops working on different nodes never contend.

#ifndef MEADOW_SCHEDULING_NODE_CATALOG_H
#define MEADOW_SCHEDULING_NODE_CATALOG_H

#include <map>
#include <string>
#include <vector>

#include <boost/thread/mutex.hpp>
#include <boost/thread/shared_mutex.hpp>

#include "base/common.h"
#include "base/node_desc.pb.h"
#include "base/resource_vector.h"
#include "base/types.h"

namespace meadow {
namespace scheduler {

enum CatalogStatus {
  CATALOG_OK = 0,
  CATALOG_INSUFFICIENT_CAPACITY = 1,
  CATALOG_NODE_NOT_FOUND = 2,
  CATALOG_NODE_NOT_READY = 3,
};

const char* CatalogStatusToString(CatalogStatus status);

// Node membership changes as seen by the control loops.
enum NodeEventType {
  NODE_EVENT_READY = 0,
  NODE_EVENT_DRAINING = 1,
  NODE_EVENT_UNREACHABLE = 2,
  NODE_EVENT_REMOVED = 3,
};

const char* NodeEventTypeToString(NodeEventType type);

// Point-in-time view of one node.
struct NodeState {
  NodeState() : status(NodeDescriptor::NODE_READY), incarnation(0) {}
  // Throws InvariantViolation if allocated exceeds the total capacity.
  ResourceVector free() const { return total_capacity - allocated; }

  NodeID_t node_id;
  ResourceVector total_capacity;
  ResourceVector allocated;
  NodeDescriptor::NodeStatus status;
  // Distinguishes successive registrations of the same node id.
  uint64_t incarnation;
};

class NodeCatalog {
 public:
  NodeCatalog();

  /**
   * Registers a node, or refreshes the capacity of a known one. A refresh
   * that would shrink the capacity below what is currently allocated is
   * ignored. A refreshed unreachable node becomes ready again; a draining one
   * stays draining.
   * @param node_id the id of the node
   * @param capacity the total capacity of the node
   * @return true if the node was not known before
   */
  bool UpsertNode(const NodeID_t& node_id, const ResourceVector& capacity);
  CatalogStatus MarkUnreachable(const NodeID_t& node_id);
  CatalogStatus MarkDraining(const NodeID_t& node_id);
  CatalogStatus MarkReady(const NodeID_t& node_id);
  // Forgets a node. Capacity still reserved on it is dropped with it.
  CatalogStatus RemoveNode(const NodeID_t& node_id);

  /**
   * Reserves capacity on a ready node.
   * @param node_id the node to reserve on
   * @param amount the capacity to reserve
   * @param incarnation if not NULL, set to the incarnation of the node the
   * reservation was made on; it must be passed back to Release()
   * @return CATALOG_INSUFFICIENT_CAPACITY if the free capacity of the node
   * does not cover the amount
   */
  CatalogStatus Reserve(const NodeID_t& node_id, const ResourceVector& amount,
                        uint64_t* incarnation);

  /**
   * Returns capacity previously reserved on a node, whatever its status.
   * Releasing against a node that has since been removed (or removed and
   * registered again) is a no-op returning CATALOG_NODE_NOT_FOUND.
   * Throws InvariantViolation if more is released than is allocated.
   */
  CatalogStatus Release(const NodeID_t& node_id, const ResourceVector& amount,
                        uint64_t incarnation);

  // All nodes, in ascending node id order.
  vector<NodeState> Snapshot() const;
  bool GetNode(const NodeID_t& node_id, NodeState* node) const;
  size_t NumNodes() const;

 private:
  struct NodeEntry {
    NodeEntry(const ResourceVector& capacity, uint64_t incarnation)
      : total_capacity(capacity), status(NodeDescriptor::NODE_READY),
        incarnation(incarnation) {}
    boost::mutex lock;
    ResourceVector total_capacity;
    ResourceVector allocated;
    NodeDescriptor::NodeStatus status;
    const uint64_t incarnation;
  };

  shared_ptr<NodeEntry> FindEntry(const NodeID_t& node_id) const;
  CatalogStatus SetStatus(const NodeID_t& node_id,
                          NodeDescriptor::NodeStatus status);

  mutable boost::shared_mutex membership_lock_;
  map<NodeID_t, shared_ptr<NodeEntry> > nodes_;
  uint64_t next_incarnation_;
};

}  // namespace scheduler
}  // namespace meadow

#endif  // MEADOW_SCHEDULING_NODE_CATALOG_H
