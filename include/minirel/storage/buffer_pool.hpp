#pragma once

#include <minirel/core_types.hpp>
#include <minirel/result.hpp>
#include <minirel/types.hpp>
#include <minirel/storage/page.hpp>
#include <minirel/storage/pager.hpp>
#include <minirel/storage/replacer.hpp>
#include <minirel/util/logger.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace minirel {

/**
 * Counters kept by one buffer pool since creation or the last reset_stats().
 */
struct BufferPoolStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t pages_read = 0;
    uint64_t pages_written = 0;

    // hits / (hits + misses), 0 when nothing was fetched
    double hit_rate() const {
        uint64_t total = hits + misses;
        return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
    }

    nlohmann::json to_json() const;
};

// One entry of the optional eviction log
struct EvictionRecord {
    PageId page_id = INVALID_PAGE_ID;
    bool was_dirty = false;

    bool operator==(const EvictionRecord& other) const {
        return page_id == other.page_id && was_dirty == other.was_dirty;
    }
};

class PageGuard;

/**
 * BufferPool - Manages a bounded pool of in-memory page frames over one Pager.
 *
 * Provides:
 * - Page fetching with read-through to the pager on a miss
 * - Pin/unpin semantics; pinned frames are never evicted
 * - LRU or clock eviction of unpinned frames
 * - Dirty page tracking and write-back before a frame is reused
 * - Hit/miss/eviction counters and an optional eviction log
 *
 * The pool never grows: when every frame is pinned, fetch_page() and
 * new_page() fail with POOL_EXHAUSTED.
 */
class BufferPool {
public:
    /**
     * Create a buffer pool.
     *
     * @param pool_size Number of page frames in the pool
     * @param pager The pager for I/O (not owned)
     * @param policy Replacement strategy
     * @param eviction_log Record every eviction when true
     * @param logger Destination for write-back failures the destructor cannot return
     */
    BufferPool(size_t pool_size, Pager* pager,
               EvictionPolicy policy = EvictionPolicy::LRU,
               bool eviction_log = false,
               Logger* logger = null_logger());

    ~BufferPool();

    // Prevent copying
    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    /**
     * Fetch a page, loading it from the pager on a miss.
     * The page's pin count is incremented.
     *
     * @param page_id The page to fetch
     * @return The pinned page, OUT_OF_RANGE for an unallocated page,
     *         POOL_EXHAUSTED if every frame is pinned
     */
    Result<Page*> fetch_page(PageId page_id);

    /**
     * Reserve a frame, extend the file by one page and return it pinned.
     * Counts as neither a hit nor a miss.
     *
     * @return The zeroed page, POOL_EXHAUSTED or ALLOCATION_ERROR
     */
    Result<Page*> new_page();

    /**
     * Pinned-handle variants of fetch_page() / new_page().
     */
    Result<PageGuard> fetch_guarded(PageId page_id);
    Result<PageGuard> new_guarded();

    /**
     * Unpin a page, decrementing its pin count.
     * When pin_count reaches 0, the page becomes evictable.
     *
     * @param page_id The page to unpin
     * @param is_dirty Mark the page as dirty if true
     * @return false if the page is not resident or not pinned
     */
    bool unpin_page(PageId page_id, bool is_dirty = false);

    /**
     * Mark a resident page as dirty.
     */
    void mark_dirty(PageId page_id);

    /**
     * Write a resident dirty page back to the pager.
     * A page that is not resident is already on disk.
     */
    Result<void> flush_page(PageId page_id);

    /**
     * Write every dirty page back, then flush the pager.
     */
    Result<void> flush_all_pages();

    size_t get_pool_size() const { return pool_size_; }

    // Frames that are unused or hold an unpinned page
    size_t get_free_frame_count() const;

    // Frames that hold a page
    size_t resident_count() const;

    bool contains_page(PageId page_id) const;

    /**
     * Get the pin count of a page.
     * Returns 0 if the page is not in the buffer pool.
     */
    uint32_t get_pin_count(PageId page_id) const;

    bool is_dirty(PageId page_id) const;

    EvictionPolicy policy() const { return policy_; }

    Pager* pager() const { return pager_; }

    BufferPoolStats stats() const;
    void reset_stats();

    bool eviction_log_enabled() const { return eviction_log_enabled_; }
    std::vector<EvictionRecord> eviction_log() const;
    void clear_eviction_log();

private:
    // Free frame or evicted victim; caller holds mutex_
    Result<size_t> acquire_frame();

    // Write back (if dirty) and detach the page held by a frame
    Result<void> evict_page(size_t frame_id);

    Result<void> write_back(size_t frame_id);

    struct FrameInfo {
        PageId page_id = INVALID_PAGE_ID;
        bool is_dirty = false;
        uint32_t pin_count = 0;
    };

    size_t pool_size_;
    Pager* pager_;
    EvictionPolicy policy_;
    bool eviction_log_enabled_;
    Logger* logger_;

    // Page frames
    std::vector<std::unique_ptr<Page>> pages_;
    std::vector<FrameInfo> frame_info_;

    // Page table: page_id -> frame_id
    std::unordered_map<PageId, size_t> page_table_;

    // Free frames, lowest index at the back
    std::vector<size_t> free_frames_;

    std::unique_ptr<Replacer> replacer_;

    BufferPoolStats stats_;
    std::vector<EvictionRecord> eviction_log_;

    mutable std::mutex mutex_;
};

/**
 * PageGuard - Owns one pin on a buffer pool page.
 *
 * The pin is released when the guard is destroyed, reassigned or
 * release() is called; the dirty flag set through mark_dirty() is
 * passed to unpin_page() at that point.
 */
class PageGuard {
public:
    PageGuard() = default;
    PageGuard(BufferPool* pool, Page* page) : pool_(pool), page_(page) {}

    ~PageGuard() { release(); }

    PageGuard(const PageGuard&) = delete;
    PageGuard& operator=(const PageGuard&) = delete;

    PageGuard(PageGuard&& other) noexcept
        : pool_(other.pool_), page_(other.page_), dirty_(other.dirty_) {
        other.pool_ = nullptr;
        other.page_ = nullptr;
        other.dirty_ = false;
    }

    PageGuard& operator=(PageGuard&& other) noexcept {
        if (this != &other) {
            release();
            pool_ = other.pool_;
            page_ = other.page_;
            dirty_ = other.dirty_;
            other.pool_ = nullptr;
            other.page_ = nullptr;
            other.dirty_ = false;
        }
        return *this;
    }

    Page* get() const { return page_; }
    Page* operator->() const { return page_; }
    explicit operator bool() const { return page_ != nullptr; }

    PageId page_id() const { return page_ ? page_->get_page_id() : INVALID_PAGE_ID; }

    void mark_dirty() { dirty_ = true; }

    void release() {
        if (pool_ && page_) {
            pool_->unpin_page(page_->get_page_id(), dirty_);
        }
        pool_ = nullptr;
        page_ = nullptr;
        dirty_ = false;
    }

private:
    BufferPool* pool_ = nullptr;
    Page* page_ = nullptr;
    bool dirty_ = false;
};

}  // namespace minirel
