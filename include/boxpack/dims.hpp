#pragma once

#include <algorithm>
#include <array>
#include <cstdint>

namespace boxpack {

struct Dims {
    int length = 0;
    int width = 0;
    int height = 0;

    std::int64_t volume() const {
        return static_cast<std::int64_t>(length) * static_cast<std::int64_t>(width) *
               static_cast<std::int64_t>(height);
    }

    // Ascending order; two triples describe the same solid up to rotation iff their sorted forms match.
    std::array<int, 3> sorted() const {
        std::array<int, 3> s{length, width, height};
        std::sort(s.begin(), s.end());
        return s;
    }

    int longest() const { return std::max(length, std::max(width, height)); }
};

inline bool operator==(const Dims& a, const Dims& b) {
    return a.length == b.length && a.width == b.width && a.height == b.height;
}

inline bool operator!=(const Dims& a, const Dims& b) { return !(a == b); }

}  // namespace boxpack
