#pragma once

#include <minirel/storage/replacer.hpp>

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace minirel {

/**
 * LRUReplacer - Selects the least recently accessed unpinned frame.
 *
 * Every access moves the frame to the MRU end of the list. Pinned frames
 * keep their position, so once unpinned they are ranked by their last
 * access, not by the time of the unpin.
 */
class LRUReplacer : public Replacer {
public:
    /**
     * Create an LRU replacer with the specified capacity.
     *
     * @param capacity Maximum number of frames that can be tracked
     */
    explicit LRUReplacer(size_t capacity);

    void record_access(size_t frame_id) override;
    void set_evictable(size_t frame_id, bool evictable) override;
    void remove(size_t frame_id) override;
    std::optional<size_t> victim() override;
    size_t size() const override;

    /**
     * Check if a frame is tracked and evictable.
     */
    bool contains(size_t frame_id) const;

private:
    struct Entry {
        std::list<size_t>::iterator position;
        bool evictable = false;
    };

    size_t capacity_;
    size_t evictable_count_ = 0;

    // Doubly-linked list: front = MRU, back = LRU
    std::list<size_t> lru_list_;

    // Map from frame_id to its place in lru_list_
    std::unordered_map<size_t, Entry> frame_map_;

    mutable std::mutex mutex_;
};

}  // namespace minirel
