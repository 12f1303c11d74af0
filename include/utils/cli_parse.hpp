#pragma once

#include <stdexcept>
#include <string>

#include "boxpack/fit_policy.hpp"

inline std::string require_arg(int& i, int argc, char** argv, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error("Missing value for " + flag + ".");
    }
    return argv[++i];
}

inline int parse_int(const std::string& s) {
    size_t pos = 0;
    int v = std::stoi(s, &pos);
    if (pos != s.size()) {
        throw std::runtime_error("Invalid integer: " + s);
    }
    return v;
}

inline int parse_non_negative_int(const std::string& s, const std::string& flag) {
    const int v = parse_int(s);
    if (v < 0) {
        throw std::runtime_error(flag + " must be >= 0.");
    }
    return v;
}

inline boxpack::FitPolicy parse_fit_policy(const std::string& s) {
    if (s == "per-item") {
        return boxpack::FitPolicy::kPerItem;
    }
    if (s == "shelf") {
        return boxpack::FitPolicy::kShelf;
    }
    throw std::runtime_error("Invalid --policy (use per-item|shelf): " + s);
}
