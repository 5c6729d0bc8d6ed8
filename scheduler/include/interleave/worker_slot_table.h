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

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include "Logger.hpp"
#include "interleave/config.h"
#include "interleave/turn_gate.h"

namespace interleave {

enum class SlotState : uint8_t { Active, Finished };

// Everything the scheduler knows about one worker.
struct WorkerSlot {
  WorkerSlot(WorkerId id, SkipSet skip_set) : id(id), skip_set(std::move(skip_set)) {}

  WorkerId id;
  SkipSet skip_set;
  uint32_t steps = 0;
  SlotState state = SlotState::Active;
  std::optional<std::thread::id> thread;
  TurnGate gate;
};

// The ordered registry of workers. Registration order is the rotation order.
//
// Workers are added with add() and the table is then sealed. After seal() the set of slots never
// changes. Only their thread binding, state and step counter do, and all of those are read and
// written under `lock_`, so the sequencer never observes a half-finished worker.
class WorkerSlotTable {
 public:
  WorkerSlotTable() : logger_(logging::getLogger("interleave.slots")) {}
  WorkerSlotTable(const WorkerSlotTable&) = delete;
  WorkerSlotTable& operator=(const WorkerSlotTable&) = delete;

  // Register a new worker in the Active state with a closed gate. Must not be called after seal().
  WorkerId add(SkipSet skip_set);

  // Freeze the schedule.
  void seal();
  bool sealed() const;

  // Associate the thread that runs worker `id`. Each worker is bound exactly once.
  void bind(WorkerId id, std::thread::id thread);

  // Return the worker bound to `thread`, if any.
  std::optional<WorkerId> find(std::thread::id thread) const;

  // Slots are never removed, so the returned reference stays valid for the table's lifetime.
  TurnGate& gate(WorkerId id);

  void markFinished(WorkerId id);
  bool isActive(WorkerId id) const;
  size_t activeCount() const;

  // True if the worker's current step counter value is in its skip set.
  bool skipsCurrentStep(WorkerId id) const;
  uint32_t currentStep(WorkerId id) const;

  // Increment the worker's step counter and return the new value.
  uint32_t advanceStep(WorkerId id);

  // Step counters of every worker, in schedule order.
  std::vector<uint32_t> stepCounts() const;

  size_t size() const;

 private:
  // Must be called with `lock_` held.
  WorkerSlot& slot(WorkerId id) const;

 private:
  logging::Logger logger_;

  // Protects `slots_`, `threads_`, `sealed_` and the mutable fields of every slot.
  mutable std::mutex lock_;
  std::vector<std::unique_ptr<WorkerSlot>> slots_;
  std::map<std::thread::id, WorkerId> threads_;
  bool sealed_ = false;
};

}  // namespace interleave
