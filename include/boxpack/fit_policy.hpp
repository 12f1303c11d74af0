#pragma once

namespace boxpack {

enum class FitPolicy {
    kPerItem = 0,
    kShelf = 1,
};

}  // namespace boxpack
