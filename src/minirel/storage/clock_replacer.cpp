#include <minirel/storage/clock_replacer.hpp>

namespace minirel {

ClockReplacer::ClockReplacer(size_t capacity)
    : slots_(capacity)
{}

void ClockReplacer::record_access(size_t frame_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (frame_id >= slots_.size()) {
        return;
    }
    slots_[frame_id].tracked = true;
    slots_[frame_id].referenced = true;
}

void ClockReplacer::set_evictable(size_t frame_id, bool evictable) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (frame_id >= slots_.size()) {
        return;
    }
    Slot& slot = slots_[frame_id];
    if (!slot.tracked || slot.evictable == evictable) {
        return;
    }

    slot.evictable = evictable;
    if (evictable) {
        ++evictable_count_;
    } else {
        --evictable_count_;
    }
}

void ClockReplacer::remove(size_t frame_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (frame_id >= slots_.size()) {
        return;
    }
    Slot& slot = slots_[frame_id];
    if (slot.evictable) {
        --evictable_count_;
    }
    slot = Slot{};
}

std::optional<size_t> ClockReplacer::victim() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (evictable_count_ == 0) {
        return std::nullopt;
    }

    // Two full turns: the first may only clear reference bits
    size_t n = slots_.size();
    for (size_t step = 0; step < 2 * n; ++step) {
        size_t frame_id = hand_;
        hand_ = (hand_ + 1) % n;

        Slot& slot = slots_[frame_id];
        if (!slot.tracked || !slot.evictable) {
            continue;
        }
        if (slot.referenced) {
            slot.referenced = false;
            continue;
        }

        slot = Slot{};
        --evictable_count_;
        return frame_id;
    }

    return std::nullopt;
}

size_t ClockReplacer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evictable_count_;
}

size_t ClockReplacer::hand() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hand_;
}

}  // namespace minirel
