/******************************************************************************
 * streaming_aggregator.h
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
#include <utility>
#include <vector>

#include "algorithms/aggregation/cycle_aggregator.h"
#include "data_structure/node_id_map.h"
#include "tlx/logger.hpp"

// Processes input that is sorted by group key, holding only the open group
// in memory. A group is searched as soon as a record with a different key
// arrives, and once more for the last group at the end of the input.
// Sortedness is not checked: unsorted input splits groups and silently gives
// wrong answers.
class streaming_aggregator : public cycle_aggregator {
 public:
    static constexpr bool debug = false;

    explicit streaming_aggregator(
        size_t progress_interval =
            configuration::getConfig()->progress_interval)
        : cycle_aggregator(progress_interval) { }

    ~streaming_aggregator() { }

    best_result aggregate(std::istream& in) override {
        resetCounters();
        best_result best;
        bool open = false;
        group_key current;
        std::set<std::pair<std::string, std::string> > edges;

        m_stats = record_io::readRecords(
            in, [&](const edge_record& record) {
                if (!open || record.key != current) {
                    if (open)
                        closeGroup(current, &edges, &best);

                    current = record.key;
                    open = true;
                    m_groups++;
                    if (progressDue(m_groups)) {
                        LOG1 << "Progress: " << m_groups << " groups";
                    }
                }
                edges.emplace(record.source, record.destination);
            });

        if (open)
            closeGroup(current, &edges, &best);

        LOG << "read " << m_stats.records << " records in "
            << m_groups << " groups";
        return best;
    }

    std::string name() const override {
        return "streaming";
    }

 private:
    // Searches the group and empties edges and the local id table.
    void closeGroup(const group_key& key,
                    std::set<std::pair<std::string, std::string> >* edges,
                    best_result* best) {
        if (best->canImprove(edges->size())) {
            std::vector<node_edge> local_edges;
            local_edges.reserve(edges->size());
            for (const auto& [src, dst] : *edges) {
                local_edges.emplace_back(m_local_ids.getOrInsert(src),
                                         m_local_ids.getOrInsert(dst));
            }
            searchGroup(key, local_edges, edges->size(), best);
        }

        m_local_ids.clear();
        edges->clear();
    }

    node_id_map m_local_ids;
};
