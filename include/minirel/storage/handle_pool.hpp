#pragma once

#include <minirel/result.hpp>
#include <minirel/types.hpp>
#include <minirel/storage/buffer_pool.hpp>
#include <minirel/storage/pager.hpp>
#include <minirel/util/logger.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace minirel {

namespace fs = std::filesystem;

/**
 * FileHandle - The one (Pager, BufferPool) pair of a physical page file.
 *
 * Owned by the HandlePool; callers borrow it between acquire() and release().
 */
struct FileHandle {
    fs::path path;
    std::unique_ptr<Pager> pager;
    std::unique_ptr<BufferPool> pool;  // destroyed before the pager
    size_t ref_count = 0;
};

/**
 * HandlePool - Registry guaranteeing a single open handle per page file.
 *
 * Two acquirers of the same file share pages, dirty state and statistics.
 * Paths are normalized before lookup, so "data/t.tbl" and "./data/t.tbl"
 * name the same handle. Destroying the pool flushes and closes every
 * remaining handle.
 */
class HandlePool {
public:
    explicit HandlePool(Logger* logger = null_logger());
    ~HandlePool();

    HandlePool(const HandlePool&) = delete;
    HandlePool& operator=(const HandlePool&) = delete;

    /**
     * Return the handle of a file, opening it on first use.
     * Each call adds one reference.
     *
     * @param path Page file (created if missing)
     * @param page_size Page size of the file
     * @param capacity Buffer pool frames, used only when the file is opened
     * @param policy Eviction policy, used only when the file is opened
     * @param eviction_log Enable the eviction log, used only when the file is opened
     * @return INVALID_ARGUMENT if the file is already open with another page size
     */
    Result<FileHandle*> acquire(const fs::path& path, size_t page_size, size_t capacity,
                                EvictionPolicy policy = EvictionPolicy::LRU,
                                bool eviction_log = false);

    /**
     * Drop one reference. The last release flushes and closes the file.
     *
     * @return NOT_FOUND if the path has no open handle
     */
    Result<void> release(const fs::path& path);

    bool contains(const fs::path& path) const;

    // References held on a file, 0 if it is not open
    size_t ref_count(const fs::path& path) const;

    // Number of open files
    size_t size() const;

    /**
     * Write back the dirty pages of every open file.
     */
    Result<void> flush_all();

    /**
     * Flush and close every file regardless of references.
     */
    Result<void> close_all();

private:
    static std::string normalize(const fs::path& path);

    Result<void> close_handle(FileHandle& handle);

    std::unordered_map<std::string, std::unique_ptr<FileHandle>> handles_;
    Logger* logger_;
    mutable std::mutex mutex_;
};

}  // namespace minirel
