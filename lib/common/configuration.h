/******************************************************************************
 * configuration.h
 *
 * Source of RoutingCycle.
 *
 ******************************************************************************
 * Copyright (C) 2026 RoutingCycle authors
 *
 * Published under the MIT license in the LICENSE file.
 *****************************************************************************/
#pragma once

#include <memory>
#include <string>

#include "common/definitions.h"

class configuration {
 public:
    configuration(configuration const&) = delete;
    void operator = (configuration const&) = delete;

    static std::shared_ptr<configuration> getConfig() {
        static std::shared_ptr<configuration> instance{ new configuration };
        return instance;
    }

    ~configuration() { }

    // Settings - these are public for ease of use
    // don't change in program when not necessary
    std::string input_filename;
    bool sorted = false;
    bool verbose = false;

    // 0 disables progress notices
    size_t progress_interval = DEFAULT_PROGRESS_INTERVAL;

 private:
    configuration() { }
};
