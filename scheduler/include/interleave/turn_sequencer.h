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

#include <mutex>
#include <optional>

#include "Logger.hpp"
#include "interleave/config.h"
#include "interleave/worker_slot_table.h"

namespace interleave {

// A cyclic cursor over the schedule.
//
// Each call to nextActive() probes slots starting at the cursor, wrapping at the end of the
// schedule, and stops at the first Active one. Finished slots are passed over without using up a
// turn. The cursor is left just past the slot that was returned, so successive calls walk the
// schedule in registration order.
class TurnSequencer {
 public:
  explicit TurnSequencer(const WorkerSlotTable& slots)
      : logger_(logging::getLogger("interleave.sequencer")), slots_(slots) {}

  // Return the next Active worker in rotation order, or std::nullopt if a full lap over the
  // schedule found none.
  //
  // This function is thread safe. Calls are serialized.
  std::optional<WorkerId> nextActive();

 private:
  logging::Logger logger_;
  const WorkerSlotTable& slots_;

  // Protects `cursor_`
  std::mutex lock_;
  // Index of the next slot to probe
  size_t cursor_ = 0;
};

}  // namespace interleave
