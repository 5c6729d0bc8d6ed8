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

#include <thread>

#include "gtest/gtest.h"

#include "Logger.hpp"
#include "interleave/worker_slot_table.h"

using namespace interleave;

TEST(worker_slot_table_test, ids_follow_registration_order) {
  WorkerSlotTable slots;
  ASSERT_EQ(WorkerId{0}, slots.add({}));
  ASSERT_EQ(WorkerId{1}, slots.add({1, 2}));
  ASSERT_EQ(WorkerId{2}, slots.add({}));
  slots.seal();
  ASSERT_TRUE(slots.sealed());
  ASSERT_EQ(3, slots.size());
  ASSERT_EQ(3, slots.activeCount());
}

TEST(worker_slot_table_test, find_bound_threads) {
  WorkerSlotTable slots;
  auto id = slots.add({});
  slots.seal();

  ASSERT_FALSE(slots.find(std::this_thread::get_id()).has_value());
  slots.bind(id, std::this_thread::get_id());
  auto found = slots.find(std::this_thread::get_id());
  ASSERT_TRUE(found.has_value());
  ASSERT_EQ(id, *found);

  // Another thread is not a worker
  std::optional<WorkerId> from_other_thread;
  std::thread([&]() { from_other_thread = slots.find(std::this_thread::get_id()); }).join();
  ASSERT_FALSE(from_other_thread.has_value());
}

TEST(worker_slot_table_test, finished_slots_are_not_active) {
  WorkerSlotTable slots;
  auto a = slots.add({});
  auto b = slots.add({});
  slots.seal();

  slots.markFinished(a);
  ASSERT_FALSE(slots.isActive(a));
  ASSERT_TRUE(slots.isActive(b));
  ASSERT_EQ(1, slots.activeCount());

  slots.markFinished(b);
  ASSERT_EQ(0, slots.activeCount());
}

TEST(worker_slot_table_test, skip_set_is_indexed_by_step) {
  WorkerSlotTable slots;
  auto id = slots.add({0, 2});
  slots.seal();

  ASSERT_EQ(0, slots.currentStep(id));
  ASSERT_TRUE(slots.skipsCurrentStep(id));
  ASSERT_EQ(1, slots.advanceStep(id));
  ASSERT_FALSE(slots.skipsCurrentStep(id));
  ASSERT_EQ(2, slots.advanceStep(id));
  ASSERT_TRUE(slots.skipsCurrentStep(id));
  ASSERT_EQ(3, slots.advanceStep(id));
  ASSERT_FALSE(slots.skipsCurrentStep(id));
}

TEST(worker_slot_table_test, step_counts_are_per_worker) {
  WorkerSlotTable slots;
  auto a = slots.add({});
  auto b = slots.add({});
  auto c = slots.add({});
  slots.seal();

  slots.advanceStep(a);
  slots.advanceStep(c);
  slots.advanceStep(c);
  // Finishing does not reset the counter
  slots.markFinished(c);
  slots.advanceStep(c);

  ASSERT_EQ((std::vector<uint32_t>{1, 0, 3}), slots.stepCounts());
  ASSERT_EQ(0, slots.currentStep(b));
}

TEST(worker_slot_table_test, gates_start_closed) {
  WorkerSlotTable slots;
  auto a = slots.add({});
  auto b = slots.add({});
  slots.seal();

  ASSERT_FALSE(slots.gate(a).isOpen());
  slots.gate(b).open();
  ASSERT_FALSE(slots.gate(a).isOpen());
  ASSERT_TRUE(slots.gate(b).isOpen());
}

int main(int argc, char** argv) {
  logging::initLogger();
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
