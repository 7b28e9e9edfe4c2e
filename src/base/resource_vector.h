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

// Immutable multi-dimensional resource quantity (cpu cores, memory in MB, gpu
// cards).

#ifndef MEADOW_BASE_RESOURCE_VECTOR_H
#define MEADOW_BASE_RESOURCE_VECTOR_H

#include <ostream>
#include <string>

#include "base/common.h"
#include "base/resource_vector_desc.pb.h"
#include "base/schedule_desc.pb.h"

namespace meadow {

class ResourceVector {
 public:
  ResourceVector();
  ResourceVector(uint64_t cpu_cores, uint64_t memory_mb, uint64_t gpus);
  explicit ResourceVector(const ResourceVectorDescriptor& rvd);

  inline uint64_t cpu_cores() const { return cpu_cores_; }
  inline uint64_t memory_mb() const { return memory_mb_; }
  inline uint64_t gpus() const { return gpus_; }

  /**
   * Returns the amount along a single dimension.
   * @param metric the dimension to read
   */
  uint64_t Get(ScheduleDescriptor::BalancingMetric metric) const;

  /**
   * Componentwise comparison: true iff every dimension of this vector is
   * less than or equal to the corresponding dimension of other.
   */
  bool FitsIn(const ResourceVector& other) const;
  bool IsZero() const;

  ResourceVector operator+(const ResourceVector& other) const;
  // Throws InvariantViolation if any component would become negative.
  ResourceVector operator-(const ResourceVector& other) const;
  bool operator==(const ResourceVector& other) const;
  bool operator!=(const ResourceVector& other) const;
  // Same as FitsIn.
  bool operator<=(const ResourceVector& other) const;

  void ToProtobuf(ResourceVectorDescriptor* rvd) const;
  string DebugString() const;

 private:
  uint64_t cpu_cores_;
  uint64_t memory_mb_;
  uint64_t gpus_;
};

// Feasibility test: a request fits if it is componentwise <= free capacity.
inline bool Fits(const ResourceVector& request, const ResourceVector& free) {
  return request.FitsIn(free);
}

ostream& operator<<(ostream& stream, const ResourceVector& rv);

}  // namespace meadow

#endif  // MEADOW_BASE_RESOURCE_VECTOR_H
