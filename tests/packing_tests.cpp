#include <algorithm>
#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "boxpack/box_catalog.hpp"
#include "boxpack/fit.hpp"
#include "boxpack/packing.hpp"
#include "test_harness.hpp"

using boxpack::BoxCatalog;
using boxpack::BoxDefinition;
using boxpack::Dims;
using boxpack::FitPolicy;
using boxpack::Item;
using boxpack::PackOptions;
using boxpack::PackResult;
using boxpack::PackStatus;

namespace {

using Ids = std::vector<std::string>;

std::vector<Item> random_items(std::uint64_t seed, int n, int max_side) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> side(1, max_side);
    std::vector<Item> items;
    for (int i = 0; i < n; ++i) {
        items.push_back(Item{"sku-" + std::to_string(i), Dims{side(rng), side(rng), side(rng)}, i});
    }
    return items;
}

// Every item exactly once, no empty box, every item fits its box.
bool covers_exactly_once(const std::vector<boxpack::BoxAssignment>& boxes, const std::vector<Item>& items) {
    std::map<std::string, int> seen;
    for (const auto& a : boxes) {
        if (a.items.empty()) {
            return false;
        }
        for (const auto& it : a.items) {
            if (!boxpack::fits(it, a.box)) {
                return false;
            }
            seen[it.id]++;
        }
    }
    if (seen.size() != items.size()) {
        return false;
    }
    for (const auto& it : items) {
        const auto f = seen.find(it.id);
        if (f == seen.end() || f->second != 1) {
            return false;
        }
    }
    return true;
}

Ids box_ids(const PackResult& res) {
    Ids out;
    for (const auto& a : res.boxes) {
        out.push_back(a.box.id);
    }
    return out;
}

const BoxCatalog& flat_tall_catalog() {
    static const BoxCatalog cat({
        BoxDefinition{"FLAT", Dims{30, 30, 2}},
        BoxDefinition{"TALL", Dims{5, 5, 40}},
    });
    return cat;
}

}  // namespace

static void test_single_item_smallest_box() {
    const auto res = boxpack::pack(boxpack::make_items({{"a", Dims{6, 4, 4}}}));
    ASSERT_TRUE(res.ok());
    ASSERT_TRUE(res.total_boxes() == 1);
    EXPECT_EQ(res.boxes[0].box.id, std::string("BX-S"));
    EXPECT_EQ(res.boxes[0].item_ids(), Ids({"a"}));
}

static void test_two_items_share_smallest_box() {
    const auto res = boxpack::pack(boxpack::make_items({{"a", Dims{6, 4, 4}}, {"b", Dims{8, 4, 4}}}));
    ASSERT_TRUE(res.ok());
    ASSERT_TRUE(res.total_boxes() == 1);
    EXPECT_EQ(res.boxes[0].box.id, std::string("BX-S"));
    EXPECT_EQ(res.boxes[0].item_ids(), Ids({"a", "b"}));
}

static void test_per_item_check_ignores_combined_volume() {
    // Three slabs together exceed any box's volume, yet each fits BX-XL alone.
    const auto items = boxpack::make_items({{"a", Dims{20, 15, 10}}, {"b", Dims{20, 15, 10}}, {"c", Dims{20, 15, 10}}});
    const auto res = boxpack::pack(items);
    ASSERT_TRUE(res.ok());
    ASSERT_TRUE(res.total_boxes() == 1);
    EXPECT_EQ(res.boxes[0].box.id, std::string("BX-XL"));
    EXPECT_EQ(res.boxes[0].item_ids(), Ids({"a", "b", "c"}));
}

static void test_oversized_item_reported() {
    const auto res = boxpack::pack(boxpack::make_items({{"huge", Dims{100, 100, 100}}}));
    EXPECT_FALSE(res.ok());
    EXPECT_TRUE(res.status == PackStatus::kItemTooLarge);
    EXPECT_TRUE(res.boxes.empty());
    ASSERT_TRUE(res.oversized.size() == 1);
    EXPECT_EQ(res.oversized[0].id, std::string("huge"));
    EXPECT_TRUE(res.oversized[0].dims == (Dims{100, 100, 100}));
    EXPECT_TRUE(res.oversized[0].max_box_dims == (Dims{24, 20, 20}));
}

static void test_rotation_picks_medium_box() {
    const auto res = boxpack::pack(boxpack::make_items({{"e", Dims{10, 3, 3}}}));
    ASSERT_TRUE(res.ok());
    ASSERT_TRUE(res.total_boxes() == 1);
    EXPECT_EQ(res.boxes[0].box.id, std::string("BX-M"));
}

static void test_all_oversized_items_listed() {
    const auto items = boxpack::make_items({
        {"ok-1", Dims{2, 2, 2}},
        {"long", Dims{25, 1, 1}},
        {"ok-2", Dims{24, 20, 20}},
        {"wide", Dims{21, 21, 1}},
    });
    const auto res = boxpack::pack(items);
    EXPECT_TRUE(res.status == PackStatus::kItemTooLarge);
    ASSERT_TRUE(res.oversized.size() == 2);
    EXPECT_EQ(res.oversized[0].id, std::string("long"));
    EXPECT_EQ(res.oversized[1].id, std::string("wide"));

    const auto direct = boxpack::find_oversized_items(items, boxpack::default_catalog());
    EXPECT_EQ(direct.size(), res.oversized.size());
}

static void test_single_box_search() {
    const auto& cat = boxpack::default_catalog();
    const auto mixed = boxpack::make_items({{"a", Dims{2, 2, 2}}, {"b", Dims{16, 8, 12}}, {"c", Dims{1, 9, 1}}});
    const auto box = boxpack::find_smallest_single_box(mixed, cat);
    ASSERT_TRUE(box.has_value());
    EXPECT_EQ(box->id, std::string("BX-L"));

    // No smaller box accepts every item.
    for (int r = 0; r < cat.index_of(box->id); ++r) {
        EXPECT_FALSE(boxpack::items_fit(mixed, cat.at(static_cast<size_t>(r)), FitPolicy::kPerItem));
    }

    EXPECT_FALSE(boxpack::find_smallest_single_box(boxpack::make_items({{"x", Dims{30, 1, 1}}}), cat).has_value());

    const auto empty = boxpack::find_smallest_single_box({}, cat);
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty->id, std::string("BX-S"));
}

static void test_multi_box_orders_by_volume_and_lists_input_order() {
    const auto items = boxpack::make_items({
        {"A", Dims{20, 16, 12}},
        {"B", Dims{24, 2, 2}},
        {"C", Dims{1, 1, 1}},
        {"D", Dims{22, 1, 1}},
    });
    const auto boxes = boxpack::pack_into_boxes(items, boxpack::default_catalog());
    ASSERT_TRUE(boxes.size() == 2);
    EXPECT_EQ(boxes[0].box.id, std::string("BX-XL"));
    EXPECT_EQ(boxes[0].item_ids(), Ids({"A", "C"}));
    EXPECT_EQ(boxes[1].box.id, std::string("BX-XXL"));
    EXPECT_EQ(boxes[1].item_ids(), Ids({"B", "D"}));
    EXPECT_TRUE(covers_exactly_once(boxes, items));

    // The full request still prefers one box.
    const auto res = boxpack::pack(items);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(box_ids(res), Ids({"BX-XXL"}));
    EXPECT_EQ(res.boxes[0].item_ids(), Ids({"A", "B", "C", "D"}));
}

static void test_open_boxes_tried_by_catalog_rank() {
    // FLAT is opened first, but TALL ranks lower in the catalog and is tried first for later items.
    const auto items = boxpack::make_items({
        {"U", Dims{2, 2, 2}},
        {"T", Dims{4, 4, 35}},
        {"F", Dims{25, 25, 2}},
    });
    const auto boxes = boxpack::pack_into_boxes(items, flat_tall_catalog());
    ASSERT_TRUE(boxes.size() == 2);
    EXPECT_EQ(boxes[0].box.id, std::string("FLAT"));
    EXPECT_EQ(boxes[0].item_ids(), Ids({"F"}));
    EXPECT_EQ(boxes[1].box.id, std::string("TALL"));
    EXPECT_EQ(boxes[1].item_ids(), Ids({"U", "T"}));
}

static void test_equal_volumes_keep_input_order() {
    const auto items = boxpack::make_items({
        {"p", Dims{5, 5, 4}},
        {"q", Dims{4, 5, 5}},
        {"big", Dims{30, 30, 1}},
        {"r", Dims{2, 2, 25}},
    });
    const auto boxes = boxpack::pack_into_boxes(items, flat_tall_catalog());
    // big -> FLAT; p, q and r only fit TALL.
    ASSERT_TRUE(boxes.size() == 2);
    EXPECT_EQ(boxes[0].item_ids(), Ids({"big"}));
    EXPECT_EQ(boxes[1].item_ids(), Ids({"p", "q", "r"}));
}

static void test_unplaceable_item_raises() {
    const auto items = boxpack::make_items({{"ok", Dims{1, 1, 1}}, {"huge", Dims{100, 1, 1}}});
    EXPECT_THROWS_AS(boxpack::pack_into_boxes(items, boxpack::default_catalog()), boxpack::PackingError);

    try {
        boxpack::pack_into_boxes(items, boxpack::default_catalog());
    } catch (const boxpack::PackingError& e) {
        EXPECT_TRUE(std::string(e.what()).find("huge") != std::string::npos);
    }

    EXPECT_TRUE(boxpack::pack_into_boxes({}, boxpack::default_catalog()).empty());
}

static void test_oversize_check_uses_largest_volume_box() {
    // T fits TALL but not FLAT, the largest box by volume.
    const auto res = boxpack::pack(boxpack::make_items({{"T", Dims{4, 4, 35}}}), flat_tall_catalog());
    EXPECT_TRUE(res.status == PackStatus::kItemTooLarge);
    ASSERT_TRUE(res.oversized.size() == 1);
    EXPECT_TRUE(res.oversized[0].max_box_dims == (Dims{30, 30, 2}));
}

static void test_shelf_policy_splits_slabs() {
    const auto items = boxpack::make_items({{"a", Dims{20, 15, 10}}, {"b", Dims{20, 15, 10}}, {"c", Dims{20, 15, 10}}});
    PackOptions opt;
    opt.fit_policy = FitPolicy::kShelf;
    const auto res = boxpack::pack(items, opt);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(box_ids(res), Ids({"BX-XL", "BX-XL", "BX-XL"}));
    ASSERT_TRUE(res.total_boxes() == 3);
    EXPECT_EQ(res.boxes[0].item_ids(), Ids({"a"}));
    EXPECT_EQ(res.boxes[1].item_ids(), Ids({"b"}));
    EXPECT_EQ(res.boxes[2].item_ids(), Ids({"c"}));
}

static void test_shelf_policy_shares_box() {
    const auto items = boxpack::make_items({{"a", Dims{4, 4, 2}}, {"b", Dims{4, 4, 2}}, {"c", Dims{2, 2, 1}}});
    PackOptions opt;
    opt.fit_policy = FitPolicy::kShelf;
    const auto res = boxpack::pack(items, opt);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(box_ids(res), Ids({"BX-S"}));
}

static void test_random_sets_cover_every_item() {
    for (std::uint64_t seed = 1; seed <= 20; ++seed) {
        const auto items = random_items(seed, 25, 20);
        for (const FitPolicy policy : {FitPolicy::kPerItem, FitPolicy::kShelf}) {
            PackOptions opt;
            opt.fit_policy = policy;
            const auto res = boxpack::pack(items, opt);
            ASSERT_TRUE(res.ok());
            EXPECT_TRUE(!res.boxes.empty());
            EXPECT_TRUE(covers_exactly_once(res.boxes, items));

            const auto boxes = boxpack::pack_into_boxes(items, boxpack::default_catalog(), opt);
            EXPECT_TRUE(covers_exactly_once(boxes, items));
            for (const auto& a : boxes) {
                EXPECT_TRUE(boxpack::items_fit(a.items, a.box, policy));
            }
        }
    }
}

static void test_deterministic_output() {
    const auto items = random_items(7, 40, 18);
    PackOptions opt;
    opt.fit_policy = FitPolicy::kShelf;
    const auto r1 = boxpack::pack(items, opt);
    const auto r2 = boxpack::pack(items, opt);
    ASSERT_TRUE(r1.ok() && r2.ok());
    ASSERT_TRUE(r1.total_boxes() == r2.total_boxes());
    for (size_t i = 0; i < r1.boxes.size(); ++i) {
        EXPECT_EQ(r1.boxes[i].box.id, r2.boxes[i].box.id);
        EXPECT_EQ(r1.boxes[i].item_ids(), r2.boxes[i].item_ids());
    }
}

static void test_summary() {
    const auto res = boxpack::pack(boxpack::make_items({{"a", Dims{6, 4, 4}}, {"b", Dims{8, 4, 4}}}));
    const auto s = boxpack::summarize(res);
    EXPECT_EQ(s.total_boxes, 1);
    EXPECT_EQ(s.total_box_volume, static_cast<std::int64_t>(192));
    EXPECT_EQ(s.total_item_volume, static_cast<std::int64_t>(96 + 128));
    EXPECT_TRUE(s.fill_ratio > 1.16 && s.fill_ratio < 1.17);

    const auto failed = boxpack::pack(boxpack::make_items({{"x", Dims{99, 1, 1}}}));
    EXPECT_EQ(boxpack::summarize(failed).total_boxes, 0);
    EXPECT_EQ(boxpack::summarize(failed).fill_ratio, 0.0);
}

static void test_empty_request_has_no_boxes() {
    const auto res = boxpack::pack({});
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.total_boxes(), 0);
}

static void test_status_codes() {
    EXPECT_EQ(std::string(boxpack::status_code(PackStatus::kOk)), std::string("ok"));
    EXPECT_EQ(std::string(boxpack::status_code(PackStatus::kItemTooLarge)), std::string("item_too_large"));
    EXPECT_EQ(std::string(boxpack::status_code(PackStatus::kPackingError)), std::string("packing_error"));
}

int main() {
    test_single_item_smallest_box();
    test_two_items_share_smallest_box();
    test_per_item_check_ignores_combined_volume();
    test_oversized_item_reported();
    test_rotation_picks_medium_box();
    test_all_oversized_items_listed();
    test_single_box_search();
    test_multi_box_orders_by_volume_and_lists_input_order();
    test_open_boxes_tried_by_catalog_rank();
    test_equal_volumes_keep_input_order();
    test_unplaceable_item_raises();
    test_oversize_check_uses_largest_volume_box();
    test_shelf_policy_splits_slabs();
    test_shelf_policy_shares_box();
    test_random_sets_cover_every_item();
    test_deterministic_output();
    test_summary();
    test_empty_request_has_no_boxes();
    test_status_codes();
    return finish_tests("boxpack_packing_tests");
}
