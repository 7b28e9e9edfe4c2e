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

// Miscellaneous utility functions. Descriptions with their declarations.

#include "misc/utils.h"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/thread/mutex.hpp>

#include <limits>
#include <string>

#include "base/units.h"

namespace meadow {

static boost::mutex instance_id_lock_;
static InstanceID_t next_instance_id_ = 1;

InstanceID_t GenerateInstanceID() {
  boost::lock_guard<boost::mutex> lock(instance_id_lock_);
  return next_instance_id_++;
}

const string& InstanceStateToString(InstanceDescriptor::InstanceState state) {
  return ENUM_TO_STRING(InstanceDescriptor_InstanceState, state);
}

const string& NodeStatusToString(NodeDescriptor::NodeStatus status) {
  return ENUM_TO_STRING(NodeDescriptor_NodeStatus, status);
}

bool ParseMemoryQuantity(const string& str, uint64_t* memory_mb) {
  CHECK_NOTNULL(memory_mb);
  string quantity = boost::algorithm::trim_copy(str);
  if (quantity.empty())
    return false;
  uint64_t multiplier = 1;
  char unit = quantity[quantity.size() - 1];
  switch (unit) {
    case 'k':
    case 'K':
      // Only whole MB are representable.
      multiplier = 0;
      break;
    case 'm':
    case 'M':
      multiplier = 1;
      break;
    case 'g':
    case 'G':
      multiplier = GB_TO_MB;
      break;
    case 't':
    case 'T':
      multiplier = TB_TO_MB;
      break;
    default:
      unit = '\0';
  }
  if (unit != '\0')
    quantity.erase(quantity.size() - 1);
  if (quantity.empty() || quantity[0] == '-' || quantity[0] == '+')
    return false;
  uint64_t value = 0;
  try {
    value = boost::lexical_cast<uint64_t>(quantity);
  } catch (const boost::bad_lexical_cast& e) {
    VLOG(1) << "Malformed memory quantity '" << str << "': " << e.what();
    return false;
  }
  if (multiplier == 0) {
    if (value % KB_TO_MB != 0)
      return false;
    *memory_mb = value / KB_TO_MB;
    return true;
  }
  if (value > numeric_limits<uint64_t>::max() / multiplier)
    return false;
  *memory_mb = value * multiplier;
  return true;
}

}  // namespace meadow
