/******************************************************************************
 * timer.h
 *
 * Source of RoutingCycle.
 *
 ******************************************************************************
 * Copyright (C) 2026 RoutingCycle authors
 *
 * Published under the MIT license in the LICENSE file.
 *****************************************************************************/

#pragma once

#include <chrono>

class timer {
 public:
    timer() {
        m_start = timestamp();
    }

    // seconds since construction
    double elapsed() const {
        return std::chrono::duration<double>(timestamp() - m_start).count();
    }

 private:
    typedef std::chrono::steady_clock clock;

    static clock::time_point timestamp() {
        return clock::now();
    }

    clock::time_point m_start;
};
