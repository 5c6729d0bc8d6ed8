// Concord
//
// Copyright (c) 2020 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License"). You may not use
// this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright notices and license
// terms. Your use of these subcomponents is subject to the terms and conditions of the
// subcomponent's license, as noted in the LICENSE file.

#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace interleave {

// A typesafe worker id. The value is the worker's position in the schedule.
struct WorkerId {
  uint32_t val;

  bool operator==(const WorkerId& other) const { return val == other.val; }
  bool operator!=(const WorkerId& other) const { return val != other.val; }
  bool operator<(const WorkerId& other) const { return val < other.val; }
};

inline std::ostream& operator<<(std::ostream& os, const WorkerId& id) { return os << "worker-" << id.val; }

// A task body. It runs on its own thread and may call InterleavingScheduler::next() at every point
// where the interleaving should be controllable.
typedef std::function<void()> Task;

// Step indices at which a worker keeps the floor instead of handing it off. Step N is the Nth call
// to next() made by that worker, counting from 0.
typedef std::set<uint32_t> SkipSet;

// The configuration for a single scheduler instance.
struct SchedulerConfig {
  // Prefix for log lines, so that runs from different tests can be told apart.
  std::string name = "interleave";
};

}  // namespace interleave
