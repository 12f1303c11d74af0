#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "boxpack/dims.hpp"

namespace boxpack {

struct BoxDefinition {
    std::string id;
    Dims dims;  // inner dimensions

    std::int64_t volume() const { return dims.volume(); }
};

// Immutable, volume-ascending list of the available box sizes.
class BoxCatalog {
public:
    // Sorts stably by (volume, length, width, height).
    // Throws std::invalid_argument on an empty list, empty/duplicate ids or non-positive dimensions.
    explicit BoxCatalog(std::vector<BoxDefinition> boxes);

    const std::vector<BoxDefinition>& list_ascending_by_volume() const { return boxes_; }
    const BoxDefinition& largest() const { return boxes_.back(); }
    const BoxDefinition& smallest() const { return boxes_.front(); }

    size_t size() const { return boxes_.size(); }
    const BoxDefinition& at(size_t rank) const { return boxes_.at(rank); }

    // nullptr when no box has this id.
    const BoxDefinition* find(std::string_view id) const;

    // Rank in ascending-volume order, -1 when missing.
    int index_of(std::string_view id) const;

private:
    std::vector<BoxDefinition> boxes_;
};

// BX-S, BX-M, BX-L, BX-XL, BX-XXL.
std::vector<BoxDefinition> standard_boxes();

// Shared read-only instance built from standard_boxes().
const BoxCatalog& default_catalog();

}  // namespace boxpack
