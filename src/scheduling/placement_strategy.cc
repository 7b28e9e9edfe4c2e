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

// Balanced and compacted node ranking.

#include "scheduling/placement_strategy.h"

#include <algorithm>
#include <vector>

namespace meadow {
namespace scheduler {

namespace {

struct MoreFreeFirst {
  explicit MoreFreeFirst(ScheduleDescriptor::BalancingMetric m) : metric(m) {}
  bool operator()(const NodeCandidate& a, const NodeCandidate& b) const {
    uint64_t a_free = a.free.Get(metric);
    uint64_t b_free = b.free.Get(metric);
    if (a_free != b_free)
      return a_free > b_free;
    return a.node_id < b.node_id;
  }
  ScheduleDescriptor::BalancingMetric metric;
};

struct LessFreeFirst {
  explicit LessFreeFirst(ScheduleDescriptor::BalancingMetric m) : metric(m) {}
  bool operator()(const NodeCandidate& a, const NodeCandidate& b) const {
    uint64_t a_free = a.free.Get(metric);
    uint64_t b_free = b.free.Get(metric);
    if (a_free != b_free)
      return a_free < b_free;
    return a.node_id < b.node_id;
  }
  ScheduleDescriptor::BalancingMetric metric;
};

}  // namespace

void BalancedPlacementStrategy::RankNodes(
    ScheduleDescriptor::BalancingMetric metric,
    vector<NodeCandidate>* candidates) const {
  sort(candidates->begin(), candidates->end(), MoreFreeFirst(metric));
}

void CompactedPlacementStrategy::RankNodes(
    ScheduleDescriptor::BalancingMetric metric,
    vector<NodeCandidate>* candidates) const {
  sort(candidates->begin(), candidates->end(), LessFreeFirst(metric));
}

ostream& operator<<(ostream& stream,
                    const PlacementStrategyInterface& strategy) {
  return stream << "<" << strategy.name() << " placement>";
}

PlacementStrategyInterface* NewPlacementStrategy(
    ScheduleDescriptor::AllocationMode mode) {
  switch (mode) {
    case ScheduleDescriptor::SINGLE_METRIC_BALANCED:
      return new BalancedPlacementStrategy();
    case ScheduleDescriptor::SINGLE_METRIC_COMPACTED:
      return new CompactedPlacementStrategy();
    default:
      LOG(FATAL) << "Unknown allocation mode " << mode;
  }
  return NULL;
}

}  // namespace scheduler
}  // namespace meadow
