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

#include <condition_variable>
#include <mutex>

namespace interleave {

// A binary signal owned by a single worker. The worker may only run while its gate is open.
//
// The gate starts closed. open() lets exactly one pass() through, and pass() closes the gate again
// behind the caller, so a worker that hands the floor away blocks until someone opens its gate.
class TurnGate {
 public:
  TurnGate() = default;
  TurnGate(const TurnGate&) = delete;
  TurnGate& operator=(const TurnGate&) = delete;

  // Open the gate, waking the owner if it is blocked in pass(). Opening an open gate is a no-op.
  //
  // This function is thread safe.
  void open();

  // Block until the gate is open, then close it.
  //
  // This function is thread safe, but only the owning worker should call it.
  void pass();

  bool isOpen() const;

 private:
  // Protects `open_`
  mutable std::mutex lock_;
  std::condition_variable cond_var_;
  bool open_ = false;
};

}  // namespace interleave
