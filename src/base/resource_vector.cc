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

// Resource vector arithmetic.

#include "base/resource_vector.h"

#include <string>

#include "base/errors.h"

namespace meadow {

ResourceVector::ResourceVector()
  : cpu_cores_(0), memory_mb_(0), gpus_(0) {
}

ResourceVector::ResourceVector(uint64_t cpu_cores, uint64_t memory_mb,
                               uint64_t gpus)
  : cpu_cores_(cpu_cores), memory_mb_(memory_mb), gpus_(gpus) {
}

ResourceVector::ResourceVector(const ResourceVectorDescriptor& rvd)
  : cpu_cores_(rvd.cpu_cores()), memory_mb_(rvd.memory_mb()),
    gpus_(rvd.gpus()) {
}

uint64_t ResourceVector::Get(
    ScheduleDescriptor::BalancingMetric metric) const {
  switch (metric) {
    case ScheduleDescriptor::CPU:
      return cpu_cores_;
    case ScheduleDescriptor::MEMORY:
      return memory_mb_;
    case ScheduleDescriptor::GPU:
      return gpus_;
    default:
      LOG(FATAL) << "Unknown balancing metric " << metric;
  }
  return 0;
}

bool ResourceVector::FitsIn(const ResourceVector& other) const {
  return cpu_cores_ <= other.cpu_cores_ &&
    memory_mb_ <= other.memory_mb_ &&
    gpus_ <= other.gpus_;
}

bool ResourceVector::IsZero() const {
  return cpu_cores_ == 0 && memory_mb_ == 0 && gpus_ == 0;
}

ResourceVector ResourceVector::operator+(const ResourceVector& other) const {
  return ResourceVector(cpu_cores_ + other.cpu_cores_,
                        memory_mb_ + other.memory_mb_,
                        gpus_ + other.gpus_);
}

ResourceVector ResourceVector::operator-(const ResourceVector& other) const {
  if (!other.FitsIn(*this)) {
    throw InvariantViolation("negative resource quantity: " + DebugString() +
                             " - " + other.DebugString());
  }
  return ResourceVector(cpu_cores_ - other.cpu_cores_,
                        memory_mb_ - other.memory_mb_,
                        gpus_ - other.gpus_);
}

bool ResourceVector::operator==(const ResourceVector& other) const {
  return cpu_cores_ == other.cpu_cores_ &&
    memory_mb_ == other.memory_mb_ &&
    gpus_ == other.gpus_;
}

bool ResourceVector::operator!=(const ResourceVector& other) const {
  return !(*this == other);
}

bool ResourceVector::operator<=(const ResourceVector& other) const {
  return FitsIn(other);
}

void ResourceVector::ToProtobuf(ResourceVectorDescriptor* rvd) const {
  rvd->set_cpu_cores(cpu_cores_);
  rvd->set_memory_mb(memory_mb_);
  rvd->set_gpus(gpus_);
}

string ResourceVector::DebugString() const {
  stringstream ss;
  ss << "{cpu=" << cpu_cores_ << ", memory=" << memory_mb_ << "m, gpu="
     << gpus_ << "}";
  return ss.str();
}

ostream& operator<<(ostream& stream, const ResourceVector& rv) {
  return stream << rv.DebugString();
}

}  // namespace meadow
