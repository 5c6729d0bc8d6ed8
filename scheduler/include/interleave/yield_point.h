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

#include "interleave/interleaving_scheduler.h"

namespace interleave {

// An optional, non-owning handle on a scheduler's yield operation.
//
// Code that should be interleaved under test takes a YieldPoint and invokes it wherever a context
// switch may happen, e.g. before every storage access. A default constructed YieldPoint does
// nothing, so production callers pass `YieldPoint{}` and pay no cost beyond a null check.
//
// The scheduler must outlive every YieldPoint made from it.
class YieldPoint {
 public:
  YieldPoint() = default;
  explicit YieldPoint(InterleavingScheduler& scheduler) : scheduler_(&scheduler) {}

  void operator()() const {
    if (scheduler_ != nullptr) {
      scheduler_->next();
    }
  }

  explicit operator bool() const { return scheduler_ != nullptr; }

 private:
  InterleavingScheduler* scheduler_ = nullptr;
};

}  // namespace interleave
