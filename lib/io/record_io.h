/******************************************************************************
 * record_io.h
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
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

#include "data_structure/group_key.h"
#include "tlx/logger.hpp"

// One line of input: source|destination|claim_id|status_code
struct edge_record {
    std::string source;
    std::string destination;
    group_key key;
};

struct record_stats {
    size_t lines = 0;
    size_t records = 0;
    size_t empty_lines = 0;
    size_t malformed_lines = 0;
};

class record_io {
 public:
    static constexpr bool debug = false;
    static constexpr char separator = '|';
    static constexpr size_t num_fields = 4;

    // Returns false for empty lines and lines without exactly four fields.
    static bool parseRecord(const std::string& line, edge_record* record);

    // Calls callback(const edge_record&) for every well-formed line of in.
    // Malformed and empty lines are skipped. A failing stream terminates
    // the program.
    template <typename Callback>
    static record_stats readRecords(std::istream& in, Callback&& callback) {
        record_stats stats;
        edge_record record;
        std::string line;

        while (std::getline(in, line)) {
            stats.lines++;
            if (line.empty()) {
                stats.empty_lines++;
                continue;
            }

            if (!parseRecord(line, &record)) {
                LOG << "skipping malformed line " << stats.lines
                    << ": " << line;
                stats.malformed_lines++;
                continue;
            }

            stats.records++;
            callback(record);
        }

        if (in.bad()) {
            std::cerr << "Error reading input after line "
                      << stats.lines << std::endl;
            exit(3);
        }
        return stats;
    }
};

// Input of the program, either a file or standard input ("-").
// The file is closed when the input_source goes out of scope.
class input_source {
 public:
    explicit input_source(const std::string& path);

    input_source(const input_source&) = delete;
    input_source& operator = (const input_source&) = delete;

    std::istream& stream() {
        return *m_in;
    }

    bool isStdin() const {
        return m_in == &std::cin;
    }

    const std::string& path() const {
        return m_path;
    }

 private:
    std::string m_path;
    std::ifstream m_file;
    std::istream* m_in;
};
