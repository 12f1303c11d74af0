#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "boxpack/box_catalog.hpp"
#include "boxpack/dims.hpp"
#include "boxpack/fit_policy.hpp"
#include "boxpack/item.hpp"

namespace boxpack {

struct PackOptions {
    FitPolicy fit_policy = FitPolicy::kPerItem;

    // If >0, print progress every k placed items (stderr).
    int log_every = 0;
    std::string log_prefix = "[boxpack]";
};

struct BoxAssignment {
    BoxDefinition box;
    std::vector<Item> items;  // input order

    std::vector<std::string> item_ids() const;
};

struct OversizedItem {
    std::string id;
    Dims dims;
    Dims max_box_dims;
};

enum class PackStatus {
    kOk = 0,
    kItemTooLarge = 1,
    kPackingError = 2,
};

struct PackResult {
    PackStatus status = PackStatus::kOk;

    std::vector<BoxAssignment> boxes;      // kOk
    std::vector<OversizedItem> oversized;  // kItemTooLarge
    std::string message;                   // kPackingError

    bool ok() const { return status == PackStatus::kOk; }
    int total_boxes() const { return static_cast<int>(boxes.size()); }
};

// Raised by pack_into_boxes when no catalog box accepts an item.
class PackingError : public std::runtime_error {
public:
    explicit PackingError(const std::string& what) : std::runtime_error(what) {}
};

// Items that do not fit the catalog's largest box even alone, in input order.
std::vector<OversizedItem> find_oversized_items(const std::vector<Item>& items, const BoxCatalog& catalog);

// First box in ascending-volume order that accepts every item under `policy`.
std::optional<BoxDefinition> find_smallest_single_box(
    const std::vector<Item>& items,
    const BoxCatalog& catalog,
    FitPolicy policy = FitPolicy::kPerItem
);

// First-fit-decreasing over open boxes:
// - items placed by descending volume (stable on input order)
// - open boxes tried smallest catalog rank first, then opening order
// - a new box is the smallest catalog entry that accepts the item alone
// Returns assignments in opening order. Throws PackingError if some item fits no box.
std::vector<BoxAssignment> pack_into_boxes(
    const std::vector<Item>& items,
    const BoxCatalog& catalog,
    const PackOptions& opt = {}
);

// Full request: oversized check, then single box, then multi-box greedy. Never throws for geometric failures.
PackResult pack(const std::vector<Item>& items, const BoxCatalog& catalog, const PackOptions& opt = {});
PackResult pack(const std::vector<Item>& items, const PackOptions& opt = {});

struct PackSummary {
    int total_boxes = 0;
    std::int64_t total_box_volume = 0;
    std::int64_t total_item_volume = 0;
    double fill_ratio = 0.0;  // item volume / box volume, 0 when no boxes
};

PackSummary summarize(const PackResult& result);

const char* status_code(PackStatus status);

}  // namespace boxpack
