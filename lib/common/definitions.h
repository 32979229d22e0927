/******************************************************************************
 * definitions.h
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
#include <cstdint>
#include <limits>
#include <utility>

/**********************************************
 * Constants
 * ********************************************/
// Types needed for the group graph ds
typedef uint32_t NodeID;
typedef uint64_t EdgeID;
typedef size_t CycleLength;
typedef std::pair<NodeID, NodeID> node_edge;

const NodeID UNDEFINED_NODE = std::numeric_limits<NodeID>::max();

// groups between two progress notices
const size_t DEFAULT_PROGRESS_INTERVAL = 100000;
