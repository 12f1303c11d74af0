#include "boxpack/fit.hpp"

#include <algorithm>
#include <array>
#include <tuple>

namespace boxpack {
namespace {

// The six axis permutations, largest base area first (ties: taller first, then enumeration order).
std::vector<Dims> orientations_by_base(const Dims& d) {
    std::vector<Dims> out = {
        Dims{d.length, d.width, d.height},
        Dims{d.length, d.height, d.width},
        Dims{d.width, d.length, d.height},
        Dims{d.width, d.height, d.length},
        Dims{d.height, d.length, d.width},
        Dims{d.height, d.width, d.length},
    };
    std::vector<Dims> uniq;
    uniq.reserve(out.size());
    for (const auto& o : out) {
        if (std::find(uniq.begin(), uniq.end(), o) == uniq.end()) {
            uniq.push_back(o);
        }
    }
    std::stable_sort(uniq.begin(), uniq.end(), [](const Dims& a, const Dims& b) {
        const long long base_a = static_cast<long long>(a.length) * a.width;
        const long long base_b = static_cast<long long>(b.length) * b.width;
        if (base_a != base_b) {
            return base_a > base_b;
        }
        return a.height > b.height;
    });
    return uniq;
}

struct ShelfCursor {
    int x = 0;
    int y = 0;
    int z = 0;
    int row_depth = 0;     // max width used by the current row
    int layer_height = 0;  // max height used by the current layer
};

bool try_place(ShelfCursor& c, const std::vector<Dims>& orients, const Dims& box) {
    for (const auto& o : orients) {
        if (c.x + o.length <= box.length && c.y + o.width <= box.width && c.z + o.height <= box.height) {
            c.x += o.length;
            c.row_depth = std::max(c.row_depth, o.width);
            c.layer_height = std::max(c.layer_height, o.height);
            return true;
        }
    }
    return false;
}

}  // namespace

bool fits(const Dims& item, const Dims& box) {
    const std::array<int, 3> a = item.sorted();
    const std::array<int, 3> b = box.sorted();
    return a[0] <= b[0] && a[1] <= b[1] && a[2] <= b[2];
}

bool fits(const Item& item, const BoxDefinition& box) {
    return fits(item.dims, box.dims);
}

bool shelf_pack_fits(const std::vector<Item>& items, const Dims& box) {
    std::vector<const Item*> order;
    order.reserve(items.size());
    for (const auto& it : items) {
        order.push_back(&it);
    }
    std::stable_sort(order.begin(), order.end(), [](const Item* a, const Item* b) {
        return std::make_tuple(a->volume(), a->dims.longest()) > std::make_tuple(b->volume(), b->dims.longest());
    });

    ShelfCursor c;
    for (const Item* it : order) {
        const std::vector<Dims> orients = orientations_by_base(it->dims);

        if (try_place(c, orients, box)) {
            continue;
        }

        // New row.
        c.x = 0;
        c.y += c.row_depth;
        c.row_depth = 0;
        if (try_place(c, orients, box)) {
            continue;
        }

        // New layer.
        c.x = 0;
        c.y = 0;
        c.z += c.layer_height;
        c.row_depth = 0;
        c.layer_height = 0;
        if (!try_place(c, orients, box)) {
            return false;
        }
    }
    return true;
}

bool items_fit(const std::vector<Item>& items, const BoxDefinition& box, FitPolicy policy) {
    for (const auto& it : items) {
        if (!fits(it, box)) {
            return false;
        }
    }
    if (policy == FitPolicy::kShelf) {
        return shelf_pack_fits(items, box.dims);
    }
    return true;
}

}  // namespace boxpack
