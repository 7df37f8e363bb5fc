#include <minirel/storage/buffer_pool.hpp>

namespace minirel {

nlohmann::json BufferPoolStats::to_json() const {
    return nlohmann::json{
        {"hits", hits},
        {"misses", misses},
        {"evictions", evictions},
        {"pages_read", pages_read},
        {"pages_written", pages_written},
        {"hit_rate", hit_rate()}
    };
}

BufferPool::BufferPool(size_t pool_size, Pager* pager, EvictionPolicy policy,
                       bool eviction_log, Logger* logger)
    : pool_size_(pool_size)
    , pager_(pager)
    , policy_(policy)
    , eviction_log_enabled_(eviction_log)
    , logger_(logger ? logger : null_logger())
    , replacer_(make_replacer(policy, pool_size))
{
    // Allocate page frames
    pages_.reserve(pool_size);
    frame_info_.resize(pool_size);
    free_frames_.reserve(pool_size);

    for (size_t i = 0; i < pool_size; ++i) {
        pages_.push_back(std::make_unique<Page>(pager->page_size()));
    }
    // Hand out frame 0 first
    for (size_t i = pool_size; i > 0; --i) {
        free_frames_.push_back(i - 1);
    }
}

BufferPool::~BufferPool() {
    // Flush all dirty pages before destruction
    auto result = flush_all_pages();
    if (!result.ok()) {
        logger_->error("Buffer pool for " + pager_->path().string() +
                       " lost dirty pages: " + result.error().to_string());
    }
}

Result<Page*> BufferPool::fetch_page(PageId page_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Check if page is already in buffer pool
    auto it = page_table_.find(page_id);
    if (it != page_table_.end()) {
        size_t frame_id = it->second;
        frame_info_[frame_id].pin_count++;
        replacer_->record_access(frame_id);
        replacer_->set_evictable(frame_id, false);
        stats_.hits++;
        return pages_[frame_id].get();
    }

    if (page_id == INVALID_PAGE_ID || page_id >= pager_->page_count()) {
        return Error(ErrorCode::OUT_OF_RANGE,
                     "Page " + std::to_string(page_id) + " is not allocated in " +
                     pager_->path().filename().string());
    }

    // Need to load from disk - find a frame
    auto frame = acquire_frame();
    if (!frame.ok()) {
        return frame.error();
    }
    size_t frame_id = frame.value();

    Page* page = pages_[frame_id].get();
    auto result = pager_->read_page(page_id, page->get_data());
    if (!result.ok()) {
        page->reset();
        free_frames_.push_back(frame_id);
        return result.error();
    }
    page->set_page_id(page_id);

    stats_.misses++;
    stats_.pages_read++;

    // Update metadata
    frame_info_[frame_id].page_id = page_id;
    frame_info_[frame_id].is_dirty = false;
    frame_info_[frame_id].pin_count = 1;
    page_table_[page_id] = frame_id;
    replacer_->record_access(frame_id);
    replacer_->set_evictable(frame_id, false);

    return page;
}

Result<Page*> BufferPool::new_page() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Reserve the frame first so a full pool does not leave an unused page on disk
    auto frame = acquire_frame();
    if (!frame.ok()) {
        return frame.error();
    }
    size_t frame_id = frame.value();

    auto allocated = pager_->allocate_page();
    if (!allocated.ok()) {
        free_frames_.push_back(frame_id);
        return allocated.error();
    }
    PageId page_id = allocated.value();

    // Initialize the new page
    Page* page = pages_[frame_id].get();
    page->reset();
    page->set_page_id(page_id);

    // Update metadata
    frame_info_[frame_id].page_id = page_id;
    frame_info_[frame_id].is_dirty = false;  // Matches the zeroed page on disk
    frame_info_[frame_id].pin_count = 1;
    page_table_[page_id] = frame_id;
    replacer_->record_access(frame_id);
    replacer_->set_evictable(frame_id, false);

    return page;
}

Result<PageGuard> BufferPool::fetch_guarded(PageId page_id) {
    auto page = fetch_page(page_id);
    if (!page.ok()) {
        return page.error();
    }
    return PageGuard(this, page.value());
}

Result<PageGuard> BufferPool::new_guarded() {
    auto page = new_page();
    if (!page.ok()) {
        return page.error();
    }
    return PageGuard(this, page.value());
}

bool BufferPool::unpin_page(PageId page_id, bool is_dirty) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = page_table_.find(page_id);
    if (it == page_table_.end()) {
        return false;
    }

    size_t frame_id = it->second;
    FrameInfo& info = frame_info_[frame_id];

    if (info.pin_count == 0) {
        return false;  // Already unpinned
    }

    info.pin_count--;
    if (is_dirty) {
        info.is_dirty = true;
    }

    if (info.pin_count == 0) {
        replacer_->set_evictable(frame_id, true);  // Add to eviction candidates
    }

    return true;
}

void BufferPool::mark_dirty(PageId page_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = page_table_.find(page_id);
    if (it != page_table_.end()) {
        frame_info_[it->second].is_dirty = true;
    }
}

Result<void> BufferPool::flush_page(PageId page_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = page_table_.find(page_id);
    if (it == page_table_.end()) {
        return Ok();  // Not in buffer pool, nothing to flush
    }

    return write_back(it->second);
}

Result<void> BufferPool::flush_all_pages() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t i = 0; i < pool_size_; ++i) {
        if (frame_info_[i].page_id != INVALID_PAGE_ID) {
            auto result = write_back(i);
            if (!result.ok()) {
                return result;
            }
        }
    }

    return pager_->flush();
}

size_t BufferPool::get_free_frame_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return free_frames_.size() + replacer_->size();
}

size_t BufferPool::resident_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return page_table_.size();
}

bool BufferPool::contains_page(PageId page_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return page_table_.find(page_id) != page_table_.end();
}

uint32_t BufferPool::get_pin_count(PageId page_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = page_table_.find(page_id);
    if (it == page_table_.end()) {
        return 0;
    }
    return frame_info_[it->second].pin_count;
}

bool BufferPool::is_dirty(PageId page_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = page_table_.find(page_id);
    return it != page_table_.end() && frame_info_[it->second].is_dirty;
}

BufferPoolStats BufferPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void BufferPool::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = BufferPoolStats{};
}

std::vector<EvictionRecord> BufferPool::eviction_log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return eviction_log_;
}

void BufferPool::clear_eviction_log() {
    std::lock_guard<std::mutex> lock(mutex_);
    eviction_log_.clear();
}

Result<size_t> BufferPool::acquire_frame() {
    // First, try to get a free frame
    if (!free_frames_.empty()) {
        size_t frame_id = free_frames_.back();
        free_frames_.pop_back();
        return frame_id;
    }

    // Otherwise, ask the replacer for a victim
    auto victim = replacer_->victim();
    if (!victim.has_value()) {
        return Error(ErrorCode::POOL_EXHAUSTED,
                     "All " + std::to_string(pool_size_) + " frames of " +
                     pager_->path().filename().string() + " are pinned");
    }

    size_t frame_id = victim.value();
    auto result = evict_page(frame_id);
    if (!result.ok()) {
        // Keep the page resident and evictable
        replacer_->record_access(frame_id);
        replacer_->set_evictable(frame_id, true);
        return result.error();
    }

    return frame_id;
}

Result<void> BufferPool::evict_page(size_t frame_id) {
    FrameInfo& info = frame_info_[frame_id];
    bool was_dirty = info.is_dirty;

    auto result = write_back(frame_id);
    if (!result.ok()) {
        return result;
    }

    stats_.evictions++;
    if (eviction_log_enabled_) {
        eviction_log_.push_back(EvictionRecord{info.page_id, was_dirty});
    }

    // Remove from page table
    page_table_.erase(info.page_id);

    // Reset frame info
    info.page_id = INVALID_PAGE_ID;
    info.is_dirty = false;
    info.pin_count = 0;
    pages_[frame_id]->reset();

    return Ok();
}

Result<void> BufferPool::write_back(size_t frame_id) {
    FrameInfo& info = frame_info_[frame_id];
    if (!info.is_dirty) {
        return Ok();
    }

    Page* page = pages_[frame_id].get();
    auto result = pager_->write_page(info.page_id, page->get_data(), page->size());
    if (!result.ok()) {
        return result;
    }

    info.is_dirty = false;
    stats_.pages_written++;
    return Ok();
}

}  // namespace minirel
