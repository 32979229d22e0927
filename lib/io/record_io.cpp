/******************************************************************************
 * record_io.cpp
 *
 * Source of RoutingCycle.
 *
 ******************************************************************************
 * Copyright (C) 2026 RoutingCycle authors
 *
 * Published under the MIT license in the LICENSE file.
 *****************************************************************************/

#include "io/record_io.h"

#include <string>
#include <utility>
#include <vector>

#include "tlx/string/split.hpp"

bool record_io::parseRecord(const std::string& line, edge_record* record) {
    if (line.empty())
        return false;

    // one more than needed, so that surplus fields are noticed
    std::vector<std::string> fields =
        tlx::split(separator, line, num_fields + 1);

    if (fields.size() != num_fields)
        return false;

    record->source = std::move(fields[0]);
    record->destination = std::move(fields[1]);
    record->key.claim_id = std::move(fields[2]);
    record->key.status_code = std::move(fields[3]);
    return true;
}

input_source::input_source(const std::string& path)
    : m_path(path),
      m_in(&std::cin) {
    if (path == "-")
        return;

    m_file.open(path.c_str());
    if (!m_file) {
        std::cerr << "Error opening " << path << std::endl;
        exit(2);
    }
    m_in = &m_file;
}
