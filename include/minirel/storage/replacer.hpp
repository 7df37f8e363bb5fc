#pragma once

#include <minirel/types.hpp>

#include <cstddef>
#include <memory>
#include <optional>

namespace minirel {

/**
 * Replacer - Victim selection for a buffer pool.
 *
 * The buffer pool reports every access to a frame and whether the frame
 * may currently be evicted (pin_count == 0). Implementations only choose
 * among evictable frames and must be deterministic for a given sequence
 * of calls.
 */
class Replacer {
public:
    virtual ~Replacer() = default;

    /**
     * Record a hit or load of the frame. Starts tracking unknown frames
     * as non-evictable.
     */
    virtual void record_access(size_t frame_id) = 0;

    /**
     * Mark a tracked frame as evictable (unpinned) or not (pinned).
     */
    virtual void set_evictable(size_t frame_id, bool evictable) = 0;

    /**
     * Stop tracking a frame (its page left the pool without eviction).
     */
    virtual void remove(size_t frame_id) = 0;

    /**
     * Choose and stop tracking a victim.
     *
     * @return The frame to reuse, or std::nullopt if every tracked frame is pinned
     */
    virtual std::optional<size_t> victim() = 0;

    // Number of evictable frames
    virtual size_t size() const = 0;

    bool empty() const { return size() == 0; }
};

std::unique_ptr<Replacer> make_replacer(EvictionPolicy policy, size_t capacity);

}  // namespace minirel
