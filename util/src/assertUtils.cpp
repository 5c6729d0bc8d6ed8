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

#include "assertUtils.hpp"

#include <execinfo.h>
#include <cstdlib>

namespace assertUtils {

static constexpr int MAX_FRAMES = 64;

logging::Logger& assertLogger() {
  static logging::Logger logger = logging::getLogger("interleave.assert");
  return logger;
}

void printCallStack() {
  void* frames[MAX_FRAMES];
  int size = backtrace(frames, MAX_FRAMES);
  char** symbols = backtrace_symbols(frames, size);
  if (symbols == nullptr) {
    LOG_FATAL(assertLogger(), "Unable to symbolize call stack");
    return;
  }
  for (int i = 0; i < size; ++i) {
    LOG_FATAL(assertLogger(), "  #" << i << " " << symbols[i]);
  }
  free(symbols);
}

}  // namespace assertUtils
