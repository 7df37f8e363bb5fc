#include <minirel/types.hpp>

#include <algorithm>
#include <cctype>

namespace minirel {

const char* eviction_policy_name(EvictionPolicy policy) {
    switch (policy) {
        case EvictionPolicy::LRU: return "LRU";
        case EvictionPolicy::CLOCK: return "CLOCK";
        default: return "UNKNOWN";
    }
}

std::optional<EvictionPolicy> parse_eviction_policy(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "LRU") return EvictionPolicy::LRU;
    if (upper == "CLOCK") return EvictionPolicy::CLOCK;
    return std::nullopt;
}

Result<void> Config::validate() const {
    if (data_directory.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "data_directory must be set");
    }

    // Power of two keeps page boundaries aligned with disk blocks
    if (page_size < MIN_PAGE_SIZE || page_size > MAX_PAGE_SIZE ||
        (page_size & (page_size - 1)) != 0) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "page_size must be a power of two in [" +
                     std::to_string(MIN_PAGE_SIZE) + ", " +
                     std::to_string(MAX_PAGE_SIZE) + "], got " +
                     std::to_string(page_size));
    }

    if (buffer_pool_size == 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "buffer_pool_size must be positive");
    }

    if (btree_order < 4) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "btree_order must be at least 4, got " + std::to_string(btree_order));
    }

    return Ok();
}

}  // namespace minirel
