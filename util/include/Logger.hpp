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

#include <string>

#include <log4cplus/logger.h>
#include <log4cplus/loggingmacros.h>

namespace logging {

typedef log4cplus::Logger Logger;

// Default properties file read by initLogger() when INTERLEAVE_LOG_CONFIG is not set.
static constexpr const char* DEFAULT_LOG_CONFIG = "log4cplus.properties";

// Return the logger with the given hierarchical name, e.g. "interleave.scheduler".
Logger getLogger(const std::string& name);

// Configure log4cplus from `config_file`. If the file cannot be read, a basic console
// configuration is installed instead.
//
// Safe to call more than once. Only the first call has any effect.
void initLogger(const std::string& config_file);

// Configure log4cplus from the file named by INTERLEAVE_LOG_CONFIG, or DEFAULT_LOG_CONFIG.
void initLogger();

}  // namespace logging

#define LOG_TRACE(l, s) LOG4CPLUS_TRACE(l, s)
#define LOG_DEBUG(l, s) LOG4CPLUS_DEBUG(l, s)
#define LOG_INFO(l, s) LOG4CPLUS_INFO(l, s)
#define LOG_WARN(l, s) LOG4CPLUS_WARN(l, s)
#define LOG_ERROR(l, s) LOG4CPLUS_ERROR(l, s)
#define LOG_FATAL(l, s) LOG4CPLUS_FATAL(l, s)
