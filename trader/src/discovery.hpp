#pragma once

#include "types.hpp"
#include <vector>
#include <cstddef>

// Pull-based source of newly listed tokens. Each poll returns what arrived
// since the previous one; an empty batch is normal.
class DiscoveryFeed {
public:
    virtual ~DiscoveryFeed() = default;
    virtual std::vector<TokenMeta> poll(size_t max_items) = 0;
};
