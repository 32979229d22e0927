/******************************************************************************
 * group_key.h
 *
 * Source of RoutingCycle.
 *
 ******************************************************************************
 * Copyright (C) 2026 RoutingCycle authors
 *
 * Published under the MIT license in the LICENSE file.
 *****************************************************************************/

#pragma once

#include <functional>
#include <string>
#include <tuple>
#include <utility>

// Identity of a group of edge records. Ordered by claim id, then status code.
struct group_key {
    std::string claim_id;
    std::string status_code;

    group_key() { }

    group_key(std::string claim, std::string status)
        : claim_id(std::move(claim)),
          status_code(std::move(status)) { }

    bool operator < (const group_key& other) const {
        return std::tie(claim_id, status_code)
               < std::tie(other.claim_id, other.status_code);
    }

    bool operator == (const group_key& other) const {
        return claim_id == other.claim_id && status_code == other.status_code;
    }

    bool operator != (const group_key& other) const {
        return !(*this == other);
    }
};

struct group_key_hash {
    size_t operator () (const group_key& key) const {
        size_t h1 = std::hash<std::string>()(key.claim_id);
        size_t h2 = std::hash<std::string>()(key.status_code);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
