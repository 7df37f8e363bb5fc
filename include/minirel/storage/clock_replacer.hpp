#pragma once

#include <minirel/storage/replacer.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace minirel {

/**
 * ClockReplacer - Second-chance (clock-sweep) victim selection.
 *
 * Frames sit on a fixed ring indexed by frame id. An access sets the
 * frame's reference bit. The hand sweeps the ring from where it last
 * stopped: a set bit is cleared and skipped, and the first evictable
 * frame with a clear bit is the victim.
 */
class ClockReplacer : public Replacer {
public:
    explicit ClockReplacer(size_t capacity);

    void record_access(size_t frame_id) override;
    void set_evictable(size_t frame_id, bool evictable) override;
    void remove(size_t frame_id) override;
    std::optional<size_t> victim() override;
    size_t size() const override;

    // Current hand position (next frame the sweep inspects)
    size_t hand() const;

private:
    struct Slot {
        bool tracked = false;
        bool evictable = false;
        bool referenced = false;
    };

    std::vector<Slot> slots_;
    size_t hand_ = 0;
    size_t evictable_count_ = 0;

    mutable std::mutex mutex_;
};

}  // namespace minirel
