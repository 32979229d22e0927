/******************************************************************************
 * group_graph.h
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
#include <iterator>
#include <vector>

#include "common/definitions.h"

// Half-open range [begin, end) of consecutive ids, used to iterate nodes and
// the outgoing edges of a node.
template <typename T>
class id_range {
 public:
    class iterator {
     public:
        typedef std::forward_iterator_tag iterator_category;
        typedef T value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const T* pointer;
        typedef const T& reference;

        explicit iterator(T value) : m_value(value) { }

        T operator * () const { return m_value; }

        iterator& operator ++ () {
            ++m_value;
            return *this;
        }

        bool operator == (const iterator& other) const {
            return m_value == other.m_value;
        }

        bool operator != (const iterator& other) const {
            return m_value != other.m_value;
        }

     private:
        T m_value;
    };

    id_range(T begin, T end) : m_begin(begin), m_end(end) { }

    iterator begin() const { return iterator(m_begin); }
    iterator end() const { return iterator(m_end); }

 private:
    T m_begin;
    T m_end;
};

// Static directed graph of one group in adjacency array form.
// Construction follows the usual protocol: start_construction, then for every
// node in id order new_node() followed by the edges leaving it, then
// finish_construction.
class group_graph {
 public:
    group_graph() : m_current_node(0) {
        m_first_edge.push_back(0);
    }

    void start_construction(NodeID nodes, EdgeID edges) {
        m_current_node = 0;
        m_first_edge.clear();
        m_first_edge.reserve(static_cast<size_t>(nodes) + 1);
        m_first_edge.push_back(0);
        m_targets.clear();
        m_targets.reserve(edges);
    }

    NodeID new_node() {
        NodeID node = m_current_node++;
        m_first_edge.push_back(m_targets.size());
        return node;
    }

    // source has to be the node created last
    EdgeID new_edge(NodeID source, NodeID target) {
        EdgeID e = m_targets.size();
        m_targets.push_back(target);
        m_first_edge[source + 1] = m_targets.size();
        return e;
    }

    void finish_construction() {
        m_targets.shrink_to_fit();
    }

    NodeID number_of_nodes() const {
        return static_cast<NodeID>(m_first_edge.size() - 1);
    }

    EdgeID number_of_edges() const {
        return m_targets.size();
    }

    EdgeID get_first_edge(NodeID node) const {
        return m_first_edge[node];
    }

    EdgeID get_first_invalid_edge(NodeID node) const {
        return m_first_edge[node + 1];
    }

    NodeID getEdgeTarget(EdgeID e) const {
        return m_targets[e];
    }

    EdgeID getNodeDegree(NodeID node) const {
        return get_first_invalid_edge(node) - get_first_edge(node);
    }

    id_range<NodeID> nodes() const {
        return id_range<NodeID>(0, number_of_nodes());
    }

    id_range<EdgeID> edges_of(NodeID node) const {
        return id_range<EdgeID>(get_first_edge(node),
                                get_first_invalid_edge(node));
    }

    // Builds the graph of a group from its edges. Duplicate edges collapse,
    // node ids may be arbitrary and are remapped to 0..n-1 in ascending
    // order. Only nodes incident to an edge appear in the graph.
    template <typename Iterator>
    static group_graph fromEdges(Iterator begin, Iterator end) {
        std::vector<node_edge> edges(begin, end);
        std::sort(edges.begin(), edges.end());
        edges.erase(std::unique(edges.begin(), edges.end()), edges.end());

        std::vector<NodeID> ids;
        ids.reserve(2 * edges.size());
        for (const node_edge& e : edges) {
            ids.push_back(e.first);
            ids.push_back(e.second);
        }
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

        auto local = [&ids](NodeID id) {
            return static_cast<NodeID>(
                std::lower_bound(ids.begin(), ids.end(), id) - ids.begin());
        };

        // the remapping is monotone, edges stay sorted by source
        group_graph G;
        G.start_construction(static_cast<NodeID>(ids.size()), edges.size());
        size_t pos = 0;
        for (NodeID n = 0; n < ids.size(); ++n) {
            G.new_node();
            while (pos < edges.size() && local(edges[pos].first) == n) {
                G.new_edge(n, local(edges[pos].second));
                ++pos;
            }
        }
        G.finish_construction();
        return G;
    }

    template <typename Container>
    static group_graph fromEdges(const Container& edges) {
        return fromEdges(std::begin(edges), std::end(edges));
    }

 private:
    std::vector<EdgeID> m_first_edge;
    std::vector<NodeID> m_targets;
    NodeID m_current_node;
};
