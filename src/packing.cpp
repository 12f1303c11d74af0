#include "boxpack/packing.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <utility>

#include "boxpack/fit.hpp"
#include "boxpack/logging.hpp"

namespace boxpack {
namespace {

struct OpenBox {
    int rank = 0;    // catalog rank of the chosen box
    int opened = 0;  // opening sequence number
    BoxAssignment assignment;
};

std::vector<Item> in_input_order(std::vector<Item> items) {
    std::stable_sort(items.begin(), items.end(), [](const Item& a, const Item& b) { return a.order < b.order; });
    return items;
}

std::vector<Item> by_descending_volume(std::vector<Item> items) {
    std::stable_sort(items.begin(), items.end(), [](const Item& a, const Item& b) {
        if (a.volume() != b.volume()) {
            return a.volume() > b.volume();
        }
        return a.order < b.order;
    });
    return items;
}

// Index into `open` of the first box accepting `it`, or -1.
int find_open_box(const std::vector<OpenBox>& open, const Item& it, FitPolicy policy) {
    std::vector<size_t> idx(open.size());
    for (size_t i = 0; i < idx.size(); ++i) {
        idx[i] = i;
    }
    std::sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
        if (open[a].rank != open[b].rank) {
            return open[a].rank < open[b].rank;
        }
        return open[a].opened < open[b].opened;
    });

    for (size_t k : idx) {
        const auto& a = open[k].assignment;
        std::vector<Item> trial = a.items;
        trial.push_back(it);
        if (items_fit(trial, a.box, policy)) {
            return static_cast<int>(k);
        }
    }
    return -1;
}

// Catalog rank of the smallest box accepting `it` alone, or -1.
int find_new_box(const BoxCatalog& catalog, const Item& it, FitPolicy policy) {
    const std::vector<Item> alone{it};
    const auto& boxes = catalog.list_ascending_by_volume();
    for (size_t r = 0; r < boxes.size(); ++r) {
        if (items_fit(alone, boxes[r], policy)) {
            return static_cast<int>(r);
        }
    }
    return -1;
}

std::string prefix_of(const PackOptions& opt) {
    return opt.log_prefix.empty() ? std::string("[boxpack]") : opt.log_prefix;
}

}  // namespace

std::vector<std::string> BoxAssignment::item_ids() const {
    std::vector<std::string> out;
    out.reserve(items.size());
    for (const auto& it : items) {
        out.push_back(it.id);
    }
    return out;
}

std::vector<OversizedItem> find_oversized_items(const std::vector<Item>& items, const BoxCatalog& catalog) {
    const BoxDefinition& largest = catalog.largest();
    std::vector<OversizedItem> out;
    for (const auto& it : in_input_order(items)) {
        if (!fits(it, largest)) {
            out.push_back(OversizedItem{it.id, it.dims, largest.dims});
        }
    }
    return out;
}

std::optional<BoxDefinition> find_smallest_single_box(
    const std::vector<Item>& items,
    const BoxCatalog& catalog,
    FitPolicy policy
) {
    for (const auto& box : catalog.list_ascending_by_volume()) {
        if (items_fit(items, box, policy)) {
            return box;
        }
    }
    return std::nullopt;
}

std::vector<BoxAssignment> pack_into_boxes(
    const std::vector<Item>& items,
    const BoxCatalog& catalog,
    const PackOptions& opt
) {
    const std::string prefix = prefix_of(opt);
    if (opt.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << prefix << " multi-box start items=" << items.size() << " boxes=" << catalog.size() << "\n";
    }

    std::vector<OpenBox> open;
    const std::vector<Item> order = by_descending_volume(items);

    for (size_t t = 0; t < order.size(); ++t) {
        const Item& it = order[t];

        const int k = find_open_box(open, it, opt.fit_policy);
        if (k >= 0) {
            open[static_cast<size_t>(k)].assignment.items.push_back(it);
        } else {
            const int rank = find_new_box(catalog, it, opt.fit_policy);
            if (rank < 0) {
                throw PackingError("Item '" + it.id + "' does not fit in any available box.");
            }
            OpenBox ob;
            ob.rank = rank;
            ob.opened = static_cast<int>(open.size());
            ob.assignment.box = catalog.at(static_cast<size_t>(rank));
            ob.assignment.items.push_back(it);
            open.push_back(std::move(ob));
        }

        if (opt.log_every > 0 && ((t + 1) % static_cast<size_t>(opt.log_every)) == 0) {
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << prefix << " placed=" << (t + 1) << "/" << order.size() << " open_boxes=" << open.size()
                      << "\n";
        }
    }

    std::vector<BoxAssignment> out;
    out.reserve(open.size());
    for (auto& ob : open) {
        ob.assignment.items = in_input_order(std::move(ob.assignment.items));
        out.push_back(std::move(ob.assignment));
    }

    if (opt.log_every > 0) {
        std::lock_guard<std::mutex> lk(log_mutex());
        std::cerr << prefix << " multi-box done boxes=" << out.size() << "\n";
    }
    return out;
}

PackResult pack(const std::vector<Item>& items, const BoxCatalog& catalog, const PackOptions& opt) {
    PackResult res;
    if (items.empty()) {
        return res;
    }

    res.oversized = find_oversized_items(items, catalog);
    if (!res.oversized.empty()) {
        res.status = PackStatus::kItemTooLarge;
        if (opt.log_every > 0) {
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << prefix_of(opt) << " item_too_large count=" << res.oversized.size() << "\n";
        }
        return res;
    }

    const auto single = find_smallest_single_box(items, catalog, opt.fit_policy);
    if (single) {
        res.boxes.push_back(BoxAssignment{*single, in_input_order(items)});
        if (opt.log_every > 0) {
            std::lock_guard<std::mutex> lk(log_mutex());
            std::cerr << prefix_of(opt) << " single box=" << single->id << " items=" << items.size() << "\n";
        }
        return res;
    }

    try {
        res.boxes = pack_into_boxes(items, catalog, opt);
    } catch (const PackingError& e) {
        res.status = PackStatus::kPackingError;
        res.boxes.clear();
        res.message = e.what();
    }
    return res;
}

PackResult pack(const std::vector<Item>& items, const PackOptions& opt) {
    return pack(items, default_catalog(), opt);
}

PackSummary summarize(const PackResult& result) {
    PackSummary s;
    s.total_boxes = result.total_boxes();
    for (const auto& a : result.boxes) {
        s.total_box_volume += a.box.volume();
        for (const auto& it : a.items) {
            s.total_item_volume += it.volume();
        }
    }
    if (s.total_box_volume > 0) {
        s.fill_ratio = static_cast<double>(s.total_item_volume) / static_cast<double>(s.total_box_volume);
    }
    return s;
}

const char* status_code(PackStatus status) {
    switch (status) {
        case PackStatus::kOk:
            return "ok";
        case PackStatus::kItemTooLarge:
            return "item_too_large";
        case PackStatus::kPackingError:
            return "packing_error";
    }
    return "unknown";
}

}  // namespace boxpack
