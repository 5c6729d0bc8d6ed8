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

#include "interleave/interleaving_scheduler.h"

#include <stdexcept>
#include <thread>

#include "assertUtils.hpp"

namespace interleave {

InterleavingScheduler::InterleavingScheduler(SchedulerConfig config)
    : logger_(logging::getLogger("interleave.scheduler")), config_(std::move(config)), sequencer_(slots_) {}

void InterleavingScheduler::start(std::vector<Task> tasks, std::vector<SkipSet> skip_sets) {
  if (tasks.empty()) {
    throw std::invalid_argument("InterleavingScheduler needs at least one task");
  }
  if (skip_sets.size() > tasks.size()) {
    throw std::invalid_argument("Got " + std::to_string(skip_sets.size()) + " skip sets for " +
                                std::to_string(tasks.size()) + " tasks");
  }
  if (started_.exchange(true)) {
    throw std::logic_error("InterleavingScheduler can only be started once");
  }

  // Every gate starts closed, so every worker blocks as soon as its thread starts.
  for (size_t i = 0; i < tasks.size(); ++i) {
    slots_.add(i < skip_sets.size() ? std::move(skip_sets[i]) : SkipSet{});
  }
  slots_.seal();
  failures_.resize(tasks.size());

  LOG_INFO(logger_, config_.name << ": starting " << tasks.size() << " workers");
  std::vector<std::thread> threads;
  threads.reserve(tasks.size());
  for (uint32_t i = 0; i < tasks.size(); ++i) {
    auto id = WorkerId{i};
    threads.emplace_back([this, id, &task = tasks[i]]() { runWorker(id, task); });
    slots_.bind(id, threads.back().get_id());
  }

  auto first = sequencer_.nextActive();
  Assert(first.has_value());
  giveFloor(*first);

  for (auto& thread : threads) {
    thread.join();
  }
  LOG_INFO(logger_, config_.name << ": all " << tasks.size() << " workers finished, " << failedTasks() << " failed");

  for (auto& failure : failures_) {
    if (failure) {
      std::rethrow_exception(failure);
    }
  }
}

void InterleavingScheduler::next() {
  auto id = slots_.find(std::this_thread::get_id());
  if (!id) {
    throw NotAWorkerError("InterleavingScheduler::next() called from a thread that is not one of its workers");
  }
  yieldFrom(*id);
}

std::vector<WorkerId> InterleavingScheduler::floorTrace() const {
  std::lock_guard<std::mutex> guard(trace_lock_);
  return floor_trace_;
}

size_t InterleavingScheduler::failedTasks() const {
  size_t failed = 0;
  for (const auto& failure : failures_) {
    if (failure) {
      ++failed;
    }
  }
  return failed;
}

void InterleavingScheduler::runWorker(WorkerId id, const Task& task) {
  LOG_DEBUG(logger_, config_.name << ": " << id << " started");
  slots_.gate(id).pass();
  try {
    task();
  } catch (const std::exception& e) {
    LOG_ERROR(logger_, config_.name << ": " << id << " failed: " << e.what());
    failures_[id.val] = std::current_exception();
  } catch (...) {
    LOG_ERROR(logger_, config_.name << ": " << id << " failed with a non-standard exception");
    failures_[id.val] = std::current_exception();
  }

  // The worker will never run again, but it still owns the floor and must pass it on.
  slots_.markFinished(id);
  LOG_DEBUG(logger_, config_.name << ": " << id << " finished after " << slots_.currentStep(id) << " steps");
  yieldFrom(id);
}

void InterleavingScheduler::yieldFrom(WorkerId id) {
  auto running = slots_.activeCount();
  if (running == 0) {
    LOG_DEBUG(logger_, config_.name << ": " << id << " was the last running worker");
    return;
  }

  // A finishing worker always hands off, whatever its skip set says.
  auto active = slots_.isActive(id);
  if (active && slots_.skipsCurrentStep(id)) {
    LOG_DEBUG(logger_, config_.name << ": " << id << " keeps the floor at step " << slots_.currentStep(id));
  } else {
    auto next = sequencer_.nextActive();
    Assert(next.has_value());
    LOG_DEBUG(logger_,
              config_.name << ": " << id << " hands the floor to " << *next << " at step " << slots_.currentStep(id));
    giveFloor(*next);
    if (active) {
      slots_.gate(id).pass();
    }
  }
  slots_.advanceStep(id);
}

void InterleavingScheduler::giveFloor(WorkerId id) {
  {
    std::lock_guard<std::mutex> guard(trace_lock_);
    floor_trace_.push_back(id);
  }
  slots_.gate(id).open();
}

}  // namespace interleave
