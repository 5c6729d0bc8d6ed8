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

#include <exception>

#include "Logger.hpp"

namespace assertUtils {

// Log the current call stack through the "interleave.assert" logger.
void printCallStack();

logging::Logger& assertLogger();

}  // namespace assertUtils

// Invariant checks. A failed check logs the expression and the call stack, then terminates the
// process. These are for broken internal invariants only, never for bad caller input.
#define Assert(expr)                                                                                 \
  do {                                                                                               \
    if (!(expr)) {                                                                                   \
      LOG_FATAL(assertUtils::assertLogger(),                                                         \
                "Assert failed: " #expr " at " << __FILE__ << ":" << __LINE__);                     \
      assertUtils::printCallStack();                                                                 \
      std::terminate();                                                                              \
    }                                                                                                \
  } while (0)

#define AssertLT(lhs, rhs)                                                                     \
  do {                                                                                         \
    if (!((lhs) < (rhs))) {                                                                    \
      LOG_FATAL(assertUtils::assertLogger(),                                                   \
                "AssertLT failed: " #lhs " < " #rhs " (" << (lhs) << " >= " << (rhs) << ") at " \
                                                         << __FILE__ << ":" << __LINE__);       \
      assertUtils::printCallStack();                                                           \
      std::terminate();                                                                        \
    }                                                                                          \
  } while (0)
