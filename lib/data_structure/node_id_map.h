/******************************************************************************
 * node_id_map.h
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
#include <unordered_map>

#include "common/definitions.h"

// Assigns dense ids to node names in order of first appearance.
class node_id_map {
 public:
    node_id_map() { }

    NodeID getOrInsert(const std::string& name) {
        auto it = m_ids.find(name);
        if (it != m_ids.end())
            return it->second;

        NodeID id = static_cast<NodeID>(m_ids.size());
        m_ids.emplace(name, id);
        return id;
    }

    NodeID get(const std::string& name) const {
        auto it = m_ids.find(name);
        return it == m_ids.end() ? UNDEFINED_NODE : it->second;
    }

    size_t size() const {
        return m_ids.size();
    }

    // also releases the buckets, the map is reused for the next group
    void clear() {
        std::unordered_map<std::string, NodeID>().swap(m_ids);
    }

 private:
    std::unordered_map<std::string, NodeID> m_ids;
};
