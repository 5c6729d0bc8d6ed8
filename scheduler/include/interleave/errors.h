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

#include <stdexcept>
#include <string>

namespace interleave {

// Thrown when next() is called from a thread that is not a worker of the scheduler.
class NotAWorkerError : public std::logic_error {
 public:
  explicit NotAWorkerError(const std::string& what) : std::logic_error(what) {}
};

}  // namespace interleave
