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

#include <atomic>
#include <chrono>
#include <thread>

#include "gtest/gtest.h"

#include "Logger.hpp"
#include "interleave/turn_gate.h"

using namespace std::chrono_literals;
using namespace interleave;

TEST(turn_gate_test, starts_closed) {
  TurnGate gate;
  ASSERT_FALSE(gate.isOpen());
}

TEST(turn_gate_test, open_then_pass_does_not_block) {
  TurnGate gate;
  gate.open();
  ASSERT_TRUE(gate.isOpen());
  gate.pass();
  // Passing closes the gate behind the caller
  ASSERT_FALSE(gate.isOpen());
}

TEST(turn_gate_test, opening_twice_lets_one_pass) {
  TurnGate gate;
  gate.open();
  gate.open();
  gate.pass();
  ASSERT_FALSE(gate.isOpen());
}

TEST(turn_gate_test, pass_blocks_until_opened) {
  TurnGate gate;
  std::atomic_bool passed = false;
  auto waiter = std::thread([&]() {
    gate.pass();
    passed = true;
  });

  std::this_thread::sleep_for(50ms);
  ASSERT_FALSE(passed);

  gate.open();
  waiter.join();
  ASSERT_TRUE(passed);
  ASSERT_FALSE(gate.isOpen());
}

TEST(turn_gate_test, ping_pong_between_two_threads) {
  TurnGate ping;
  TurnGate pong;
  std::vector<int> order;
  auto other = std::thread([&]() {
    for (int i = 0; i < 3; ++i) {
      pong.pass();
      order.push_back(2 * i + 1);
      ping.open();
    }
  });
  for (int i = 0; i < 3; ++i) {
    order.push_back(2 * i);
    pong.open();
    ping.pass();
  }
  other.join();
  ASSERT_EQ((std::vector<int>{0, 1, 2, 3, 4, 5}), order);
}

int main(int argc, char** argv) {
  logging::initLogger();
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
