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

// UNIX/POSIX signal handler implementation.

#include "platforms/unix/signal_handler.h"

#include <string.h>

namespace meadow {
namespace platform_unix {

volatile sig_atomic_t SignalHandler::shutdown_requested_ = 0;

SignalHandler::SignalHandler() {
  VLOG(1) << "Signal handler set up, ready to add signals.";
}

void SignalHandler::ConfigureSignal(int signum,
                                    void (*handler)(int)) {  // NOLINT
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = handler;
  sigemptyset(&action.sa_mask);
  PCHECK(sigaction(signum, &action, NULL) == 0)
      << "Failed to install handler for signal " << signum;
}

void SignalHandler::ConfigureShutdownSignals() {
  ConfigureSignal(SIGINT, &SignalHandler::RequestShutdown);
  ConfigureSignal(SIGTERM, &SignalHandler::RequestShutdown);
}

bool SignalHandler::ShutdownRequested() {
  return shutdown_requested_ != 0;
}

void SignalHandler::RequestShutdown(int signum) {
  // Only async-signal-safe work is allowed here.
  shutdown_requested_ = 1;
}

}  // namespace platform_unix
}  // namespace meadow
