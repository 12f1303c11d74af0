#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "boxpack/dims.hpp"

namespace boxpack {

struct Item {
    std::string id;
    Dims dims;
    int order = 0;  // position in the caller's input list

    std::int64_t volume() const { return dims.volume(); }
};

// Builds items from (id, dims) pairs, numbering `order` by position.
std::vector<Item> make_items(const std::vector<std::pair<std::string, Dims>>& rows);

}  // namespace boxpack
