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

#include "interleave/worker_slot_table.h"

#include <algorithm>

#include "assertUtils.hpp"

namespace interleave {

WorkerId WorkerSlotTable::add(SkipSet skip_set) {
  std::lock_guard<std::mutex> guard(lock_);
  Assert(!sealed_);
  auto id = WorkerId{static_cast<uint32_t>(slots_.size())};
  LOG_DEBUG(logger_, "Registering " << id << " with " << skip_set.size() << " skipped steps");
  slots_.push_back(std::make_unique<WorkerSlot>(id, std::move(skip_set)));
  return id;
}

void WorkerSlotTable::seal() {
  std::lock_guard<std::mutex> guard(lock_);
  sealed_ = true;
}

bool WorkerSlotTable::sealed() const {
  std::lock_guard<std::mutex> guard(lock_);
  return sealed_;
}

void WorkerSlotTable::bind(WorkerId id, std::thread::id thread) {
  std::lock_guard<std::mutex> guard(lock_);
  auto& s = slot(id);
  Assert(!s.thread.has_value());
  s.thread = thread;
  auto inserted = threads_.emplace(thread, id).second;
  Assert(inserted);
}

std::optional<WorkerId> WorkerSlotTable::find(std::thread::id thread) const {
  std::lock_guard<std::mutex> guard(lock_);
  auto it = threads_.find(thread);
  if (it == threads_.end()) {
    return std::nullopt;
  }
  return it->second;
}

TurnGate& WorkerSlotTable::gate(WorkerId id) {
  std::lock_guard<std::mutex> guard(lock_);
  return slot(id).gate;
}

void WorkerSlotTable::markFinished(WorkerId id) {
  std::lock_guard<std::mutex> guard(lock_);
  auto& s = slot(id);
  Assert(s.state == SlotState::Active);
  s.state = SlotState::Finished;
}

bool WorkerSlotTable::isActive(WorkerId id) const {
  std::lock_guard<std::mutex> guard(lock_);
  return slot(id).state == SlotState::Active;
}

size_t WorkerSlotTable::activeCount() const {
  std::lock_guard<std::mutex> guard(lock_);
  return static_cast<size_t>(
      std::count_if(slots_.begin(), slots_.end(), [](const auto& s) { return s->state == SlotState::Active; }));
}

bool WorkerSlotTable::skipsCurrentStep(WorkerId id) const {
  std::lock_guard<std::mutex> guard(lock_);
  const auto& s = slot(id);
  return s.skip_set.count(s.steps) > 0;
}

uint32_t WorkerSlotTable::currentStep(WorkerId id) const {
  std::lock_guard<std::mutex> guard(lock_);
  return slot(id).steps;
}

uint32_t WorkerSlotTable::advanceStep(WorkerId id) {
  std::lock_guard<std::mutex> guard(lock_);
  return ++slot(id).steps;
}

std::vector<uint32_t> WorkerSlotTable::stepCounts() const {
  std::lock_guard<std::mutex> guard(lock_);
  std::vector<uint32_t> counts;
  counts.reserve(slots_.size());
  for (const auto& s : slots_) {
    counts.push_back(s->steps);
  }
  return counts;
}

size_t WorkerSlotTable::size() const {
  std::lock_guard<std::mutex> guard(lock_);
  return slots_.size();
}

WorkerSlot& WorkerSlotTable::slot(WorkerId id) const {
  AssertLT(id.val, slots_.size());
  return *slots_[id.val];
}

}  // namespace interleave
