/******************************************************************************
 * longest_simple_cycle.h
 *
 * Source of RoutingCycle.
 *
 ******************************************************************************
 * Copyright (C) 2026 RoutingCycle authors
 *
 * Published under the MIT license in the LICENSE file.
 *****************************************************************************/

#pragma once

#include <algorithm>
#include <utility>
#include <vector>

#include "common/definitions.h"
#include "data_structure/group_graph.h"
#include "tlx/logger.hpp"

// Length (in hops) of the longest simple directed cycle of a group graph.
// Every node is tried as start of the cycle and all simple paths leaving it
// are enumerated with an explicit stack. This is exponential in the number of
// nodes and only feasible as groups stay small (tens to a few hundred nodes).
class longest_simple_cycle {
 public:
    static constexpr bool debug = false;

    longest_simple_cycle() { }
    virtual ~longest_simple_cycle() { }

    // 0 if the graph has no cycle. A self-loop is a cycle of length 1.
    CycleLength find(const group_graph& G) {
        m_on_path.assign(G.number_of_nodes(), false);
        CycleLength best = 0;

        for (NodeID start : G.nodes()) {
            // a simple cycle visits every node at most once
            if (best == G.number_of_nodes())
                break;

            best = std::max(best, longestCycleThrough(start, G, best));
        }

        LOG << "n=" << G.number_of_nodes() << " m=" << G.number_of_edges()
            << " longest cycle=" << best;
        return best;
    }

    template <typename Container>
    CycleLength findInEdges(const Container& edges) {
        return find(group_graph::fromEdges(edges));
    }

 private:
    CycleLength longestCycleThrough(NodeID start, const group_graph& G,
                                    CycleLength best) {
        // (node, next outgoing edge to explore); the stack is the current
        // path, so its size is the number of nodes on the path.
        m_stack.clear();
        m_stack.emplace_back(start, G.get_first_edge(start));
        m_on_path[start] = true;

        while (!m_stack.empty()) {
            NodeID current = m_stack.back().first;
            EdgeID e = m_stack.back().second;

            if (e == G.get_first_invalid_edge(current)) {
                // all edges of current explored, backtrack
                m_on_path[current] = false;
                m_stack.pop_back();
                continue;
            }

            ++m_stack.back().second;
            NodeID target = G.getEdgeTarget(e);

            if (target == start) {
                best = std::max(best, static_cast<CycleLength>(m_stack.size()));
                if (best == G.number_of_nodes()) {
                    unwind();
                    break;
                }
            } else if (!m_on_path[target]) {
                m_on_path[target] = true;
                m_stack.emplace_back(target, G.get_first_edge(target));
            }
        }
        return best;
    }

    void unwind() {
        for (const auto& entry : m_stack) {
            m_on_path[entry.first] = false;
        }
        m_stack.clear();
    }

    std::vector<bool> m_on_path;
    std::vector<std::pair<NodeID, EdgeID> > m_stack;
};
