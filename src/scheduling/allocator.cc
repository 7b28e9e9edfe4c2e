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

// Greedy first-fit allocator.

#include "scheduling/allocator.h"

#include <vector>

namespace meadow {
namespace scheduler {

Allocator::Allocator(ScheduleDescriptor::AllocationMode mode,
                     ScheduleDescriptor::BalancingMetric metric)
  : mode_(mode), metric_(metric), strategy_(NewPlacementStrategy(mode)) {
  VLOG(1) << "Allocator initiated with " << *strategy_ << " on metric "
          << ScheduleDescriptor::BalancingMetric_Name(metric);
}

PlacementPlan Allocator::Allocate(const vector<PlacementRequest>& requests,
                                  const vector<NodeState>& snapshot) const {
  PlacementPlan plan;
  vector<NodeCandidate> candidates;
  for (const NodeState& node : snapshot) {
    if (node.status != NodeDescriptor::NODE_READY)
      continue;
    candidates.push_back(NodeCandidate(node.node_id, node.free()));
  }
  for (const PlacementRequest& request : requests) {
    // The overlay changes after every assignment, so the ranking is redone
    // for each request.
    strategy_->RankNodes(metric_, &candidates);
    bool placed = false;
    for (NodeCandidate& candidate : candidates) {
      if (!Fits(request.resource_request, candidate.free))
        continue;
      candidate.free = candidate.free - request.resource_request;
      plan.assignments.push_back(make_pair(request.instance_id,
                                           candidate.node_id));
      VLOG(2) << "Planned instance " << request.instance_id << " ("
              << request.component_name << ", " << request.resource_request
              << ") on node " << candidate.node_id;
      placed = true;
      break;
    }
    if (!placed) {
      VLOG(1) << "No ready node can fit instance " << request.instance_id
              << " (" << request.component_name << ", "
              << request.resource_request << ")";
      plan.infeasible.insert(request.instance_id);
    }
  }
  return plan;
}

}  // namespace scheduler
}  // namespace meadow
