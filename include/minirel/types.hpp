#pragma once

#include <minirel/core_types.hpp>
#include <minirel/result.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace minirel {

namespace fs = std::filesystem;

// Replacement strategy used by a buffer pool instance
enum class EvictionPolicy {
    LRU,
    CLOCK
};

const char* eviction_policy_name(EvictionPolicy policy);

// Accepts "LRU" / "CLOCK" in any case
std::optional<EvictionPolicy> parse_eviction_policy(const std::string& name);

/**
 * Configuration for opening a StorageEngine.
 */
struct Config {
    fs::path data_directory;
    size_t page_size = DEFAULT_PAGE_SIZE;
    size_t buffer_pool_size = DEFAULT_POOL_CAPACITY;
    EvictionPolicy eviction_policy = EvictionPolicy::LRU;
    bool eviction_log = false;
    size_t btree_order = DEFAULT_BTREE_ORDER;
    bool verbose = false;

    /**
     * Check the configuration before any file is touched.
     *
     * @return INVALID_ARGUMENT describing the first bad field
     */
    Result<void> validate() const;
};

}  // namespace minirel
