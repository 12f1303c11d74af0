#include "boxpack/item.hpp"

namespace boxpack {

std::vector<Item> make_items(const std::vector<std::pair<std::string, Dims>>& rows) {
    std::vector<Item> out;
    out.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        out.push_back(Item{rows[i].first, rows[i].second, static_cast<int>(i)});
    }
    return out;
}

}  // namespace boxpack
