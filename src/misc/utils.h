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

#ifndef MEADOW_MISC_UTILS_H
#define MEADOW_MISC_UTILS_H

#include <string>

#include <google/protobuf/descriptor.h>

#include "base/common.h"
#include "base/types.h"
#include "base/instance_desc.pb.h"
#include "base/node_desc.pb.h"

namespace meadow {

using google::protobuf::EnumDescriptor;

#define ENUM_TO_STRING(t, v) t ## _descriptor()->FindValueByNumber(v)->name()

// Returns a process-wide unique instance ID. IDs are handed out in increasing
// order, so sorting by ID sorts instances by creation time.
InstanceID_t GenerateInstanceID();
const string& InstanceStateToString(InstanceDescriptor::InstanceState state);
const string& NodeStatusToString(NodeDescriptor::NodeStatus status);
// Parses a memory quantity such as "4096m", "8g" or "512" (MB when no unit is
// given) into MB. Returns false on malformed or negative input.
bool ParseMemoryQuantity(const string& str, uint64_t* memory_mb);

}  // namespace meadow

#endif  // MEADOW_MISC_UTILS_H
