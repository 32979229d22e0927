/******************************************************************************
 * batch_aggregator.h
 *
 * Source of RoutingCycle.
 *
 ******************************************************************************
 * Copyright (C) 2026 RoutingCycle authors
 *
 * Published under the MIT license in the LICENSE file.
 *****************************************************************************/

#pragma once

#include <set>
#include <string>
#include <unordered_map>

#include "algorithms/aggregation/cycle_aggregator.h"
#include "data_structure/node_id_map.h"
#include "tlx/logger.hpp"

// Reads the whole input into per-group edge sets before searching. Node names
// share one id table over all groups, ids of different groups are never
// compared.
class batch_aggregator : public cycle_aggregator {
 public:
    static constexpr bool debug = false;

    explicit batch_aggregator(
        size_t progress_interval =
            configuration::getConfig()->progress_interval)
        : cycle_aggregator(progress_interval) { }

    ~batch_aggregator() { }

    best_result aggregate(std::istream& in) override {
        resetCounters();
        node_id_map ids;
        std::unordered_map<group_key, std::set<node_edge>, group_key_hash>
        groups;

        m_stats = record_io::readRecords(
            in, [&ids, &groups](const edge_record& record) {
                NodeID src = ids.getOrInsert(record.source);
                NodeID dst = ids.getOrInsert(record.destination);
                groups[record.key].emplace(src, dst);
            });

        m_groups = groups.size();
        LOG << "read " << m_stats.records << " records in " << m_groups
            << " groups with " << ids.size() << " distinct nodes";

        best_result best;
        size_t processed = 0;
        for (const auto& [key, edges] : groups) {
            processed++;
            if (progressDue(processed)) {
                LOG1 << "Progress: " << processed << "/" << m_groups
                     << " groups";
            }
            searchGroup(key, edges, edges.size(), &best);
        }
        return best;
    }

    std::string name() const override {
        return "batch";
    }
};
