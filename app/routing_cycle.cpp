/******************************************************************************
 * routing_cycle.cpp
 *
 * Source of RoutingCycle.
 *
 ******************************************************************************
 * Copyright (C) 2026 RoutingCycle authors
 *
 * Published under the MIT license in the LICENSE file.
 *****************************************************************************/

#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "algorithms/aggregation/algorithms.h"
#include "common/configuration.h"
#include "io/record_io.h"
#include "tlx/cmdline_parser.hpp"
#include "tlx/logger.hpp"
#include "tools/timer.h"

int main(int argn, char** argv) {
    // standard output only carries the result line
    tlx::set_logger_to_stderr();

    tlx::CmdlineParser cmdl;
    auto cfg = configuration::getConfig();

    cmdl.set_description(
        "Find the (claim_id, status_code) group whose edges contain the "
        "longest simple directed cycle. Input lines have the form "
        "source|destination|claim_id|status_code.");
    cmdl.add_param_string("input", cfg->input_filename,
                          "path to input file, - for standard input");
    cmdl.add_flag('s', "sorted", cfg->sorted,
                  "input is sorted by claim_id and status_code, "
                  "hold only one group in memory");
    cmdl.add_size_t('p', "progress", cfg->progress_interval,
                    "groups between progress notices, 0 to disable");
    cmdl.add_flag('v', "verbose", cfg->verbose,
                  "print timing and input statistics");

    // a lone "-" would be taken as an option, pass it as positional argument
    std::vector<const char*> args;
    bool end_of_options = false;
    for (int i = 0; i < argn; ++i) {
        if (strcmp(argv[i], "--") == 0)
            end_of_options = true;
        if (!end_of_options && strcmp(argv[i], "-") == 0) {
            args.push_back("--");
            end_of_options = true;
        }
        args.push_back(argv[i]);
    }

    if (!cmdl.process(static_cast<int>(args.size()), args.data(), std::cerr))
        return 1;

    timer t;
    input_source input(cfg->input_filename);
    std::unique_ptr<cycle_aggregator> aggregator =
        selectAggregator(cfg->sorted, cfg->progress_interval);

    best_result best = aggregator->aggregate(input.stream());

    if (cfg->verbose) {
        const record_stats& stats = aggregator->stats();
        LOG1 << aggregator->name() << " scan of " << cfg->input_filename
             << " took " << t.elapsed() << "s";
        LOG1 << "lines=" << stats.lines << " records=" << stats.records
             << " empty=" << stats.empty_lines
             << " malformed=" << stats.malformed_lines
             << " groups=" << aggregator->number_of_groups()
             << " searched=" << aggregator->number_of_searches();
    }

    std::cout << best.toString() << std::endl;
    return 0;
}
