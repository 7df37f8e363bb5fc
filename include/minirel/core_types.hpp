#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace minirel {

// Page identifier - byte offset / page size within one file
using PageId = uint32_t;

// Slot index within a data page
using SlotId = uint16_t;

// Page 0 is a real page, so the sentinel sits at the top of the range
constexpr PageId INVALID_PAGE_ID = std::numeric_limits<PageId>::max();

// Page configuration
constexpr size_t DEFAULT_PAGE_SIZE = 4096;
constexpr size_t MIN_PAGE_SIZE = 512;
constexpr size_t MAX_PAGE_SIZE = 32768;  // offsets inside a page are 16-bit

constexpr size_t DEFAULT_POOL_CAPACITY = 256;
constexpr size_t DEFAULT_BTREE_ORDER = 64;

// Type tag stored in byte 0 of every page
enum class PageType : uint8_t {
    UNFORMATTED = 0x00,  // Zero-filled page fresh from allocate_page()
    DATA = 0x01,
    INDEX = 0x02
};

// Location of a tuple inside a table file
struct RecordId {
    PageId page_id = INVALID_PAGE_ID;
    SlotId slot_id = 0;

    RecordId() = default;
    RecordId(PageId page, SlotId slot) : page_id(page), slot_id(slot) {}

    bool valid() const { return page_id != INVALID_PAGE_ID; }

    bool operator==(const RecordId& other) const {
        return page_id == other.page_id && slot_id == other.slot_id;
    }
    bool operator!=(const RecordId& other) const { return !(*this == other); }

    std::string to_string() const {
        return "(" + std::to_string(page_id) + ", " + std::to_string(slot_id) + ")";
    }
};

}  // namespace minirel
