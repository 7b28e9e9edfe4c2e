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

// Common unit conversion constants.

#ifndef MEADOW_BASE_UNITS_H
#define MEADOW_BASE_UNITS_H

#include <stdint.h>

namespace meadow {

// Capacity
const uint64_t KB_TO_MB = 1024;
const uint64_t GB_TO_MB = 1024;
const uint64_t TB_TO_MB = 1024 * 1024;

// Time
const uint64_t MICROSECONDS_IN_SECOND = 1000 * 1000;
const uint64_t MILLISECONDS_TO_MICROSECONDS = 1000;

}  // namespace meadow

#endif  // MEADOW_BASE_UNITS_H
