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

#include "interleave/turn_sequencer.h"

namespace interleave {

std::optional<WorkerId> TurnSequencer::nextActive() {
  std::lock_guard<std::mutex> guard(lock_);
  auto size = slots_.size();
  for (size_t probes = 0; probes < size; ++probes) {
    if (cursor_ >= size) {
      cursor_ = 0;
    }
    auto candidate = WorkerId{static_cast<uint32_t>(cursor_)};
    ++cursor_;
    if (slots_.isActive(candidate)) {
      return candidate;
    }
    LOG_TRACE(logger_, "Passing over finished " << candidate);
  }
  LOG_DEBUG(logger_, "No active worker left in a schedule of " << size);
  return std::nullopt;
}

}  // namespace interleave
