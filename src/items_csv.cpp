#include "boxpack/items_csv.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace boxpack {
namespace {

std::string trim_copy(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return std::string(s.substr(b, e - b));
}

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        const size_t pos = line.find(',', start);
        if (pos == std::string::npos) {
            out.push_back(line.substr(start));
            break;
        }
        out.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

bool is_header(const std::string& line) {
    const std::string hdr = trim_copy(line);
    return hdr.rfind("sku,", 0) == 0 || hdr.rfind("id,", 0) == 0;
}

}  // namespace

int parse_dimension(std::string_view token) {
    const std::string s = trim_copy(token);
    if (s.empty()) {
        throw std::runtime_error("empty dimension");
    }
    size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(s, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid integer dimension: " + s);
    }
    if (pos != s.size()) {
        throw std::runtime_error("invalid integer dimension: " + s);
    }
    return v;
}

void validate_items(const std::vector<Item>& items) {
    if (items.empty()) {
        throw std::runtime_error("at least one item is required");
    }
    std::unordered_set<std::string> seen;
    for (const auto& it : items) {
        if (it.id.empty()) {
            throw std::runtime_error("item " + std::to_string(it.order) + ": sku must be non-empty");
        }
        if (it.dims.length <= 0 || it.dims.width <= 0 || it.dims.height <= 0) {
            throw std::runtime_error("item " + it.id + ": dimensions must be positive");
        }
        if (!seen.insert(it.id).second) {
            throw std::runtime_error("duplicate sku values are not allowed: " + it.id);
        }
    }
}

std::vector<Item> read_items_csv(std::istream& in) {
    std::vector<Item> items;
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        line_no++;
        if (line_no == 1 && is_header(line)) {
            continue;
        }
        if (trim_copy(line).empty()) {
            continue;
        }

        const auto fields = split_csv(line);
        if (fields.size() != 4) {
            throw std::runtime_error("line " + std::to_string(line_no) + ": expected 4 columns");
        }

        Item it;
        it.id = trim_copy(fields[0]);
        try {
            it.dims.length = parse_dimension(fields[1]);
            it.dims.width = parse_dimension(fields[2]);
            it.dims.height = parse_dimension(fields[3]);
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("line " + std::to_string(line_no) + ": " + e.what());
        }
        it.order = static_cast<int>(items.size());
        items.push_back(std::move(it));
    }

    validate_items(items);
    return items;
}

}  // namespace boxpack
