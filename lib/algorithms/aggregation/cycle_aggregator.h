/******************************************************************************
 * cycle_aggregator.h
 *
 * Source of RoutingCycle.
 *
 ******************************************************************************
 * Copyright (C) 2026 RoutingCycle authors
 *
 * Published under the MIT license in the LICENSE file.
 *****************************************************************************/

#pragma once

#include <cstddef>
#include <iostream>
#include <string>

#include "algorithms/misc/longest_simple_cycle.h"
#include "common/configuration.h"
#include "common/definitions.h"
#include "data_structure/best_result.h"
#include "data_structure/group_graph.h"
#include "data_structure/group_key.h"
#include "io/record_io.h"

// Scans edge records, groups them by key and finds the group with the
// longest simple cycle.
class cycle_aggregator {
 public:
    explicit cycle_aggregator(size_t progress_interval)
        : m_progress_interval(progress_interval),
          m_groups(0) { }

    virtual ~cycle_aggregator() { }

    virtual best_result aggregate(std::istream& in) = 0;

    virtual std::string name() const = 0;

    // statistics of the last call to aggregate()
    const record_stats& stats() const {
        return m_stats;
    }

    size_t number_of_groups() const {
        return m_groups;
    }

    size_t number_of_searches() const {
        return m_searches;
    }

 protected:
    bool progressDue(size_t processed) const {
        return m_progress_interval > 0 && processed % m_progress_interval == 0;
    }

    // Searches a group given by dense node ids and folds its cycle length
    // into best. Groups with fewer edges than the current best length
    // cannot win and are skipped.
    template <typename Container>
    void searchGroup(const group_key& key, const Container& edges,
                     size_t distinct_edges, best_result* best) {
        if (!best->canImprove(distinct_edges))
            return;

        m_searches++;
        CycleLength length = m_search.find(group_graph::fromEdges(edges));
        best->offer(key, length);
    }

    void resetCounters() {
        m_stats = record_stats();
        m_groups = 0;
        m_searches = 0;
    }

    size_t m_progress_interval;
    size_t m_groups;
    size_t m_searches = 0;
    record_stats m_stats;
    longest_simple_cycle m_search;
};
