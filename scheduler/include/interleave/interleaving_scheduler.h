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

#include <atomic>
#include <exception>
#include <mutex>
#include <vector>

#include "Logger.hpp"
#include "interleave/config.h"
#include "interleave/errors.h"
#include "interleave/turn_sequencer.h"
#include "interleave/worker_slot_table.h"

namespace interleave {

// Runs a set of tasks, each on its own thread, in a deterministic interleaving.
//
// Only one worker runs at a time. A worker holds the floor until it calls next(), at which point
// the floor passes to the next unfinished worker in registration order and the caller blocks until
// the floor comes back around. A worker can keep the floor across specific calls to next() by
// listing their step indices in its skip set. A worker whose task returns passes the floor on one
// last time and exits.
//
// The sequence in which workers get the floor depends only on the registration order, the skip
// sets and the number of next() calls each task makes. It does not depend on how the OS schedules
// the underlying threads.
//
// A scheduler runs exactly once.
//
// Example:
//
//   InterleavingScheduler scheduler;
//   scheduler.start({[&] { read(); scheduler.next(); write(); },
//                    [&] { read(); scheduler.next(); write(); }},
//                   {});
//
// runs read, read, write, write.
class InterleavingScheduler {
 public:
  explicit InterleavingScheduler(SchedulerConfig config = SchedulerConfig{});
  InterleavingScheduler(const InterleavingScheduler&) = delete;
  InterleavingScheduler& operator=(const InterleavingScheduler&) = delete;

  // Run every task to completion in the deterministic interleaving and return once all worker
  // threads have been joined.
  //
  // `skip_sets[i]` is the skip set of the worker running `tasks[i]`. Workers past the end of
  // `skip_sets` get an empty one.
  //
  // Throws std::invalid_argument if `tasks` is empty or there are more skip sets than tasks, and
  // std::logic_error if the scheduler was already started. If any task throws, the other workers
  // still run to completion and the exception of the lowest numbered failing worker is rethrown.
  //
  // There is no timeout. A task that never returns, or a skip set that keeps the floor while other
  // workers are blocked, makes this call hang.
  void start(std::vector<Task> tasks, std::vector<SkipSet> skip_sets);

  // Hand the floor to the next worker and block until it comes back, unless the caller's current
  // step is in its skip set. Either way the caller's step counter is incremented.
  //
  // Must be called from inside a running task. Throws NotAWorkerError otherwise.
  void next();

  // Workers in the order they were given the floor, starting with the initial release.
  std::vector<WorkerId> floorTrace() const;

  // Final step counter of every worker, in schedule order.
  std::vector<uint32_t> stepCounts() const { return slots_.stepCounts(); }

  // Number of tasks that exited with an exception.
  size_t failedTasks() const;

 private:
  // Body of every worker thread.
  void runWorker(WorkerId id, const Task& task);

  // The yield protocol, on behalf of worker `id`.
  void yieldFrom(WorkerId id);

  // Record `id` in the floor trace and open its gate.
  void giveFloor(WorkerId id);

 private:
  logging::Logger logger_;
  const SchedulerConfig config_;

  WorkerSlotTable slots_;
  TurnSequencer sequencer_;
  std::atomic_bool started_ = false;

  // Protects `floor_trace_`
  mutable std::mutex trace_lock_;
  std::vector<WorkerId> floor_trace_;

  // One entry per worker. Each entry is only written by its own worker thread, and only read after
  // that thread has been joined.
  std::vector<std::exception_ptr> failures_;
};

}  // namespace interleave
