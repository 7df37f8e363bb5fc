#include <minirel/storage/replacer.hpp>
#include <minirel/storage/clock_replacer.hpp>
#include <minirel/storage/lru_replacer.hpp>

namespace minirel {

std::unique_ptr<Replacer> make_replacer(EvictionPolicy policy, size_t capacity) {
    switch (policy) {
        case EvictionPolicy::CLOCK:
            return std::make_unique<ClockReplacer>(capacity);
        case EvictionPolicy::LRU:
        default:
            return std::make_unique<LRUReplacer>(capacity);
    }
}

}  // namespace minirel
