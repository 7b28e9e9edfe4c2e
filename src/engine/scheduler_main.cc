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

// Initialization code for the scheduler binary. It loads a schedule, brings
// up a simulated cluster behind the cluster state monitor and runs the
// schedule against a simulated node agent until it finishes, the run time
// expires or the process is asked to shut down.

#include <fstream>  // NOLINT
#include <sstream>  // NOLINT

#include <boost/bind.hpp>
#include <boost/thread/thread.hpp>
#include <google/protobuf/text_format.h>

#include "base/common.h"
#include "base/node_desc.pb.h"
#include "base/schedule_desc.pb.h"
#include "base/schedule_spec.h"
#include "base/units.h"
#include "engine/simulated_node_agent.h"
#include "misc/time_sources.h"
#include "platforms/unix/signal_handler.h"
#include "scheduling/cluster_state_monitor.h"
#include "scheduling/instance_event_logger.h"
#include "scheduling/node_catalog.h"
#include "scheduling/schedule_controller.h"

DEFINE_string(schedule_file, "",
              "Schedule to run, as a ScheduleDescriptor in protobuf text "
              "format.");
DEFINE_uint64(simulated_nodes, 4, "Number of simulated nodes.");
DEFINE_uint64(simulated_node_cpu, 16, "CPU cores per simulated node.");
DEFINE_uint64(simulated_node_memory_mb, 65536,
              "Memory per simulated node, in MB.");
DEFINE_uint64(simulated_node_gpus, 0, "GPUs per simulated node.");
DEFINE_uint64(run_for_ms, 0,
              "Cancel the schedule after running for this long. 0 to run "
              "until the schedule finishes or a signal arrives.");
DEFINE_uint64(status_interval_ms, 5000,
              "Interval at which the schedule status is printed.");
DECLARE_uint64(node_heartbeat_timeout_ms);

DEFINE_uint64(drain_timeout_ms, 30000,
              "Time to wait for a cancelled schedule to drain.");

using namespace meadow;  // NOLINT
using meadow::agent::SimulatedNodeAgent;
using meadow::platform_unix::SignalHandler;
using meadow::scheduler::ClusterStateMonitor;
using meadow::scheduler::InstanceEventLogger;
using meadow::scheduler::NodeCatalog;
using meadow::scheduler::ScheduleController;
using meadow::scheduler::ScheduleStatus;

namespace {

bool LoadSchedule(const string& filename, ScheduleDescriptor* sd) {
  ifstream input(filename.c_str());
  if (!input.is_open()) {
    LOG(ERROR) << "Failed to open schedule file " << filename;
    return false;
  }
  stringstream contents;
  contents << input.rdbuf();
  if (!google::protobuf::TextFormat::ParseFromString(contents.str(), sd)) {
    LOG(ERROR) << "Failed to parse schedule file " << filename;
    return false;
  }
  return true;
}

void SendHeartbeats(ClusterStateMonitor* monitor, TimeInterface* time) {
  for (uint64_t i = 0; i < FLAGS_simulated_nodes; ++i) {
    NodeDescriptor nd;
    nd.set_node_id("node-" + to_string(i));
    nd.set_hostname("sim-node-" + to_string(i));
    nd.set_private_ip_address("10.0.0." + to_string(i + 1));
    nd.mutable_capacity()->set_cpu_cores(FLAGS_simulated_node_cpu);
    nd.mutable_capacity()->set_memory_mb(FLAGS_simulated_node_memory_mb);
    nd.mutable_capacity()->set_gpus(FLAGS_simulated_node_gpus);
    nd.set_last_heartbeat(time->GetCurrentTimestamp());
    monitor->HandleHeartbeat(nd);
  }
}

}  // namespace

// The main method: initializes, loads the schedule and runs it.
int main(int argc, char *argv[]) {
  VLOG(1) << "Calling common::InitMeadow";
  common::InitMeadow(argc, argv);

  if (FLAGS_schedule_file.empty()) {
    LOG(ERROR) << "No schedule given; use --schedule_file";
    return 1;
  }
  ScheduleDescriptor sd;
  if (!LoadSchedule(FLAGS_schedule_file, &sd))
    return 1;
  string error;
  shared_ptr<const ScheduleSpec> spec = ScheduleSpec::FromDescriptor(sd,
                                                                     &error);
  if (!spec) {
    LOG(ERROR) << "Rejected schedule " << FLAGS_schedule_file << ": "
               << error;
    return 1;
  }

  SignalHandler signal_handler;
  signal_handler.ConfigureShutdownSignals();

  LOG(INFO) << "Meadow scheduler starting with " << FLAGS_simulated_nodes
            << " simulated nodes ...";
  WallTime wall_time;
  shared_ptr<NodeCatalog> node_catalog(new NodeCatalog());
  SimulatedNodeAgent node_agent;
  InstanceEventLogger event_logger;
  ScheduleController controller(node_catalog, &node_agent, &event_logger,
                                &wall_time);
  ClusterStateMonitor monitor(
      node_catalog, &wall_time,
      boost::bind(&ScheduleController::HandleNodeEvent, &controller, _1, _2));
  SendHeartbeats(&monitor, &wall_time);
  boost::thread monitor_thread(boost::bind(&ClusterStateMonitor::Run,
                                           &monitor));

  if (!controller.ActivateSchedule(spec, &error)) {
    LOG(ERROR) << "Failed to activate schedule " << spec->name() << ": "
               << error;
    monitor.Stop();
    monitor_thread.join();
    return 1;
  }

  uint64_t start = wall_time.GetCurrentTimestamp();
  uint64_t last_status = 0;
  // Simulated nodes report three times per heartbeat timeout.
  uint64_t heartbeat_interval =
    FLAGS_node_heartbeat_timeout_ms * MILLISECONDS_TO_MICROSECONDS / 3;
  uint64_t last_heartbeat = start;
  ScheduleStatus status;
  while (!SignalHandler::ShutdownRequested()) {
    if (controller.WaitForSchedule(spec->name(), 100, &status))
      break;
    uint64_t now = wall_time.GetCurrentTimestamp();
    if (now - last_heartbeat >= heartbeat_interval) {
      SendHeartbeats(&monitor, &wall_time);
      last_heartbeat = now;
    }
    if (now - last_status >=
        FLAGS_status_interval_ms * MILLISECONDS_TO_MICROSECONDS) {
      LOG(INFO) << status;
      last_status = now;
    }
    if (FLAGS_run_for_ms > 0 &&
        now - start >= FLAGS_run_for_ms * MILLISECONDS_TO_MICROSECONDS) {
      LOG(INFO) << "Run time of " << FLAGS_run_for_ms << "ms expired";
      break;
    }
  }

  if (!status.finished) {
    controller.CancelAll();
    // Nodes must stay alive while the schedule drains.
    uint64_t deadline = wall_time.GetCurrentTimestamp() +
        FLAGS_drain_timeout_ms * MILLISECONDS_TO_MICROSECONDS;
    while (!controller.WaitForSchedule(spec->name(), 100, &status) &&
           wall_time.GetCurrentTimestamp() < deadline) {
      SendHeartbeats(&monitor, &wall_time);
    }
    if (!status.finished)
      LOG(WARNING) << "Schedule did not drain in time";
  }
  LOG(INFO) << status;
  for (const ScheduleStatus& schedule : controller.ListSchedules())
    VLOG(1) << schedule;

  monitor.Stop();
  monitor_thread.join();
  controller.Shutdown();
  LOG(INFO) << "Meadow scheduler shutting down; " << event_logger.num_events()
            << " instance events logged.";
  return status.state == scheduler::SCHEDULE_FAILED ? 2 : 0;
}
