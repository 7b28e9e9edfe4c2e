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

// Receiver of instance state transitions. The instance supervisor calls it
// for every transition it makes, on the thread of the owning control loop.

#ifndef MEADOW_SCHEDULING_INSTANCE_EVENT_NOTIFIER_INTERFACE_H
#define MEADOW_SCHEDULING_INSTANCE_EVENT_NOTIFIER_INTERFACE_H

#include "base/instance_event.pb.h"
#include "base/types.h"

namespace meadow {
namespace scheduler {

class InstanceEventNotifierInterface {
 public:
  virtual ~InstanceEventNotifierInterface() {}
  virtual void OnInstanceEvent(const InstanceEvent& event) = 0;
};

}  // namespace scheduler
}  // namespace meadow

#endif  // MEADOW_SCHEDULING_INSTANCE_EVENT_NOTIFIER_INTERFACE_H
