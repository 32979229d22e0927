/******************************************************************************
 * best_result.h
 *
 * Source of RoutingCycle.
 *
 ******************************************************************************
 * Copyright (C) 2026 RoutingCycle authors
 *
 * Published under the MIT license in the LICENSE file.
 *****************************************************************************/

#pragma once

#include <string>

#include "common/definitions.h"
#include "data_structure/group_key.h"

// Running answer of a scan: the group with the longest simple cycle,
// ties broken by the smaller key. The length never decreases.
class best_result {
 public:
    best_result() : m_length(0), m_found(false) { }

    // Returns true if (key, length) replaced the current answer.
    bool offer(const group_key& key, CycleLength length) {
        if (length == 0)
            return false;

        if (!m_found || length > m_length
            || (length == m_length && key < m_key)) {
            m_key = key;
            m_length = length;
            m_found = true;
            return true;
        }
        return false;
    }

    // a cycle never has more hops than its group has distinct edges
    bool canImprove(size_t edge_count) const {
        return edge_count > 0 && edge_count >= m_length;
    }

    bool found() const {
        return m_found;
    }

    const group_key& key() const {
        return m_key;
    }

    CycleLength length() const {
        return m_length;
    }

    // claim_id,status_code,cycle_length or 0,0,0 if no cycle was seen
    std::string toString() const {
        if (!m_found)
            return "0,0,0";

        return m_key.claim_id + "," + m_key.status_code + ","
               + std::to_string(m_length);
    }

 private:
    group_key m_key;
    CycleLength m_length;
    bool m_found;
};
