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

// Common type definitions.

#ifndef MEADOW_BASE_TYPES_H
#define MEADOW_BASE_TYPES_H

#include <stdint.h>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>

#include <boost/function.hpp>

using std::map;
using std::pair;
using std::string;

namespace meadow {

using std::unique_ptr;
using std::shared_ptr;
using std::weak_ptr;
using std::enable_shared_from_this;

// Various utility typedefs
typedef uint64_t InstanceID_t;
typedef string NodeID_t;
// Desired replica count per component name.
typedef map<string, uint64_t> ReplicaCountMap_t;

}  // namespace meadow

#endif  // MEADOW_BASE_TYPES_H
