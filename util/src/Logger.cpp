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

#include "Logger.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>

#include <log4cplus/configurator.h>
#include <log4cplus/initializer.h>
#include <log4cplus/tstring.h>

namespace logging {

namespace {
std::once_flag init_flag;
}

Logger getLogger(const std::string& name) {
  return log4cplus::Logger::getInstance(LOG4CPLUS_STRING_TO_TSTRING(name));
}

void initLogger(const std::string& config_file) {
  std::call_once(init_flag, [&config_file]() {
    // Lives until process exit, which is what log4cplus expects of its initializer.
    static log4cplus::Initializer initializer;

    std::ifstream in(config_file);
    if (in.good()) {
      log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(config_file));
      return;
    }
    log4cplus::BasicConfigurator config;
    config.configure();
    log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
    LOG_INFO(getLogger("interleave"),
             "Log config file " << config_file << " not found, using basic console configuration");
  });
}

void initLogger() {
  const char* path = std::getenv("INTERLEAVE_LOG_CONFIG");
  initLogger(path != nullptr ? std::string(path) : std::string(DEFAULT_LOG_CONFIG));
}

}  // namespace logging
