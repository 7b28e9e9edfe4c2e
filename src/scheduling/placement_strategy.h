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

// Node ranking policies used by the allocator. A strategy only decides the
// order in which feasible nodes are tried; feasibility itself is checked by
// the allocator across all resource dimensions.

#ifndef MEADOW_SCHEDULING_PLACEMENT_STRATEGY_H
#define MEADOW_SCHEDULING_PLACEMENT_STRATEGY_H

#include <string>
#include <vector>

#include "base/common.h"
#include "base/resource_vector.h"
#include "base/schedule_desc.pb.h"
#include "base/types.h"

namespace meadow {
namespace scheduler {

// A node as seen by the allocator while it builds a plan.
struct NodeCandidate {
  NodeCandidate() {}
  NodeCandidate(const NodeID_t& id, const ResourceVector& free_capacity)
    : node_id(id), free(free_capacity) {}
  NodeID_t node_id;
  ResourceVector free;
};

class PlacementStrategyInterface {
 public:
  virtual ~PlacementStrategyInterface() {}
  /**
   * Orders the candidates by preference, most preferred first. Ties are
   * broken by ascending node id, so the result does not depend on the input
   * order.
   * @param metric the dimension to rank by
   * @param candidates the nodes to rank
   */
  virtual void RankNodes(ScheduleDescriptor::BalancingMetric metric,
                         vector<NodeCandidate>* candidates) const = 0;
  virtual const char* name() const = 0;
};

ostream& operator<<(ostream& stream,
                    const PlacementStrategyInterface& strategy);

// Prefers the node with the most free capacity along the metric, spreading
// load across nodes.
class BalancedPlacementStrategy : public PlacementStrategyInterface {
 public:
  void RankNodes(ScheduleDescriptor::BalancingMetric metric,
                 vector<NodeCandidate>* candidates) const;
  const char* name() const { return "balanced"; }
};

// Prefers the node with the least free capacity along the metric, packing
// requests onto as few nodes as possible.
class CompactedPlacementStrategy : public PlacementStrategyInterface {
 public:
  void RankNodes(ScheduleDescriptor::BalancingMetric metric,
                 vector<NodeCandidate>* candidates) const;
  const char* name() const { return "compacted"; }
};

// Returns a new strategy for the allocation mode. Ownership passes to the
// caller.
PlacementStrategyInterface* NewPlacementStrategy(
    ScheduleDescriptor::AllocationMode mode);

}  // namespace scheduler
}  // namespace meadow

#endif  // MEADOW_SCHEDULING_PLACEMENT_STRATEGY_H
