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

// Greedy first-fit placement of instance requests onto nodes. The allocator
// works on an in-memory overlay of a node catalog snapshot and never touches
// the catalog itself; its plan is applied by the caller.

#ifndef MEADOW_SCHEDULING_ALLOCATOR_H
#define MEADOW_SCHEDULING_ALLOCATOR_H

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "base/common.h"
#include "base/resource_vector.h"
#include "base/schedule_desc.pb.h"
#include "base/types.h"
#include "scheduling/node_catalog.h"
#include "scheduling/placement_strategy.h"

namespace meadow {
namespace scheduler {

struct PlacementRequest {
  PlacementRequest() : instance_id(0) {}
  PlacementRequest(InstanceID_t id, const string& component,
                   const ResourceVector& request)
    : instance_id(id), component_name(component), resource_request(request) {}
  InstanceID_t instance_id;
  string component_name;
  ResourceVector resource_request;
};

struct PlacementPlan {
  // In request order.
  vector<pair<InstanceID_t, NodeID_t> > assignments;
  set<InstanceID_t> infeasible;
};

class Allocator {
 public:
  Allocator(ScheduleDescriptor::AllocationMode mode,
            ScheduleDescriptor::BalancingMetric metric);

  /**
   * Places requests, oldest first, on ready nodes of the snapshot. Each
   * request goes to the first node in strategy order whose free capacity
   * covers it in every dimension; its capacity is deducted from the overlay
   * before the next request is considered. Requests that fit nowhere end up
   * in the infeasible set. There is no backtracking.
   * @param requests the requests, in creation order
   * @param snapshot a point-in-time view of the cluster
   * @return the placement plan
   */
  PlacementPlan Allocate(const vector<PlacementRequest>& requests,
                         const vector<NodeState>& snapshot) const;

  inline ScheduleDescriptor::AllocationMode mode() const { return mode_; }
  inline ScheduleDescriptor::BalancingMetric metric() const { return metric_; }

 private:
  ScheduleDescriptor::AllocationMode mode_;
  ScheduleDescriptor::BalancingMetric metric_;
  unique_ptr<PlacementStrategyInterface> strategy_;
};

}  // namespace scheduler
}  // namespace meadow

#endif  // MEADOW_SCHEDULING_ALLOCATOR_H
