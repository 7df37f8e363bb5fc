#include <minirel/storage/lru_replacer.hpp>

#include <iterator>

namespace minirel {

LRUReplacer::LRUReplacer(size_t capacity)
    : capacity_(capacity)
{}

void LRUReplacer::record_access(size_t frame_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = frame_map_.find(frame_id);
    if (it != frame_map_.end()) {
        // Already tracked, move to front (MRU)
        lru_list_.erase(it->second.position);
        lru_list_.push_front(frame_id);
        it->second.position = lru_list_.begin();
        return;
    }

    if (frame_id >= capacity_) {
        return;
    }
    lru_list_.push_front(frame_id);
    frame_map_[frame_id] = Entry{lru_list_.begin(), false};
}

void LRUReplacer::set_evictable(size_t frame_id, bool evictable) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = frame_map_.find(frame_id);
    if (it == frame_map_.end() || it->second.evictable == evictable) {
        return;
    }

    it->second.evictable = evictable;
    if (evictable) {
        ++evictable_count_;
    } else {
        --evictable_count_;
    }
}

void LRUReplacer::remove(size_t frame_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = frame_map_.find(frame_id);
    if (it == frame_map_.end()) {
        return;
    }
    if (it->second.evictable) {
        --evictable_count_;
    }
    lru_list_.erase(it->second.position);
    frame_map_.erase(it);
}

std::optional<size_t> LRUReplacer::victim() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (evictable_count_ == 0) {
        return std::nullopt;
    }

    // Walk from the back (LRU) past pinned frames
    for (auto it = lru_list_.rbegin(); it != lru_list_.rend(); ++it) {
        size_t frame_id = *it;
        auto entry = frame_map_.find(frame_id);
        if (!entry->second.evictable) {
            continue;
        }
        lru_list_.erase(std::next(it).base());
        frame_map_.erase(entry);
        --evictable_count_;
        return frame_id;
    }

    return std::nullopt;
}

size_t LRUReplacer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evictable_count_;
}

bool LRUReplacer::contains(size_t frame_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = frame_map_.find(frame_id);
    return it != frame_map_.end() && it->second.evictable;
}

}  // namespace minirel
