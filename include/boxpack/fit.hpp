#pragma once

#include <vector>

#include "boxpack/box_catalog.hpp"
#include "boxpack/dims.hpp"
#include "boxpack/fit_policy.hpp"
#include "boxpack/item.hpp"

namespace boxpack {

// Rotation-aware fit: the ascending-sorted item triple must be component-wise <= the sorted box triple.
// Equivalent to trying all six axis-aligned orientations.
bool fits(const Dims& item, const Dims& box);
bool fits(const Item& item, const BoxDefinition& box);

// Layered shelf heuristic (rows along length, rows stacked along width, layers along height).
// Conservative: a false result does not prove the items cannot be arranged.
bool shelf_pack_fits(const std::vector<Item>& items, const Dims& box);

// Group check used by both packing phases.
// kPerItem only tests each item alone against the box; it does not model shared space.
bool items_fit(const std::vector<Item>& items, const BoxDefinition& box, FitPolicy policy);

}  // namespace boxpack
