#pragma once

#include <istream>
#include <string_view>
#include <vector>

#include "boxpack/item.hpp"

namespace boxpack {

// Caller-side request checks: at least one item, non-empty unique ids, positive dimensions.
// Throws std::runtime_error describing the first violation.
void validate_items(const std::vector<Item>& items);

// Parses `sku,length,width,height` rows (header optional), then validates.
std::vector<Item> read_items_csv(std::istream& in);

int parse_dimension(std::string_view token);

}  // namespace boxpack
