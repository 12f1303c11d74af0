#include "boxpack/box_catalog.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>
#include <unordered_set>
#include <utility>

namespace boxpack {

BoxCatalog::BoxCatalog(std::vector<BoxDefinition> boxes) : boxes_(std::move(boxes)) {
    if (boxes_.empty()) {
        throw std::invalid_argument("BoxCatalog: at least one box is required");
    }

    std::unordered_set<std::string> seen;
    for (const auto& b : boxes_) {
        if (b.id.empty()) {
            throw std::invalid_argument("BoxCatalog: box id must be non-empty");
        }
        if (b.dims.length <= 0 || b.dims.width <= 0 || b.dims.height <= 0) {
            throw std::invalid_argument("BoxCatalog: box " + b.id + " must have positive inner dimensions");
        }
        if (!seen.insert(b.id).second) {
            throw std::invalid_argument("BoxCatalog: duplicate box id " + b.id);
        }
    }

    std::stable_sort(boxes_.begin(), boxes_.end(), [](const BoxDefinition& a, const BoxDefinition& b) {
        return std::make_tuple(a.volume(), a.dims.length, a.dims.width, a.dims.height) <
               std::make_tuple(b.volume(), b.dims.length, b.dims.width, b.dims.height);
    });
}

const BoxDefinition* BoxCatalog::find(std::string_view id) const {
    const int k = index_of(id);
    return (k < 0) ? nullptr : &boxes_[static_cast<size_t>(k)];
}

int BoxCatalog::index_of(std::string_view id) const {
    for (size_t i = 0; i < boxes_.size(); ++i) {
        if (boxes_[i].id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::vector<BoxDefinition> standard_boxes() {
    return {
        {"BX-S", Dims{8, 6, 4}},
        {"BX-M", Dims{12, 10, 6}},
        {"BX-L", Dims{16, 12, 8}},
        {"BX-XL", Dims{20, 16, 12}},
        {"BX-XXL", Dims{24, 20, 20}},
    };
}

const BoxCatalog& default_catalog() {
    static const BoxCatalog catalog(standard_boxes());
    return catalog;
}

}  // namespace boxpack
