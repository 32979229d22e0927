/******************************************************************************
 * algorithms.h
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

#include "algorithms/aggregation/batch_aggregator.h"
#include "algorithms/aggregation/cycle_aggregator.h"
#include "algorithms/aggregation/streaming_aggregator.h"

static std::unique_ptr<cycle_aggregator> selectAggregator(
    bool sorted, size_t progress_interval) {
    if (sorted)
        return std::make_unique<streaming_aggregator>(progress_interval);

    return std::make_unique<batch_aggregator>(progress_interval);
}
