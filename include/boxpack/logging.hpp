#pragma once

#include <mutex>

namespace boxpack {

// Global mutex to keep stderr logs from concurrent callers readable (one line at a time).
inline std::mutex& log_mutex() {
    static std::mutex mu;
    return mu;
}

}  // namespace boxpack
