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

#include "interleave/turn_gate.h"

namespace interleave {

void TurnGate::open() {
  {
    std::lock_guard<std::mutex> guard(lock_);
    open_ = true;
  }
  cond_var_.notify_one();
}

void TurnGate::pass() {
  std::unique_lock<std::mutex> lock(lock_);
  cond_var_.wait(lock, [this] { return open_; });
  open_ = false;
}

bool TurnGate::isOpen() const {
  std::lock_guard<std::mutex> guard(lock_);
  return open_;
}

}  // namespace interleave
