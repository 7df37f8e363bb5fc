#pragma once

#include <minirel/core_types.hpp>
#include <minirel/result.hpp>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace minirel {

/**
 * Page - In-memory copy of one page's bytes, held by a buffer pool frame.
 *
 * The bytes are interpreted by the DataPage / IndexPage views below; the
 * Page itself only knows its id and size. Byte 0 is always the PageType tag.
 */
class Page {
public:
    explicit Page(size_t page_size)
        : page_id_(INVALID_PAGE_ID)
        , data_(page_size, 0)
    {}

    PageId get_page_id() const { return page_id_; }
    void set_page_id(PageId id) { page_id_ = id; }

    char* get_data() { return data_.data(); }
    const char* get_data() const { return data_.data(); }
    size_t size() const { return data_.size(); }

    PageType get_page_type() const { return static_cast<PageType>(data_[0]); }

    // Reset page to initial state
    void reset() {
        page_id_ = INVALID_PAGE_ID;
        std::memset(data_.data(), 0, data_.size());
    }

private:
    PageId page_id_;
    std::vector<char> data_;
};

/**
 * DataPage - Slotted layout for table tuples.
 *
 * Layout:
 *   [0]     page type (DATA)
 *   [1]     reserved
 *   [2-3]   slot_count
 *   [4-5]   free_space_offset - start of the tuple area
 *   [6-7]   reserved
 *   [8+]    slot directory: [offset:2, length:2, flags:2] per slot
 *   [...-end] tuples, packed from the end of the page backward
 *
 * Deleting marks the slot as a tombstone; space is not compacted.
 */
class DataPage {
public:
    static constexpr size_t HEADER_SIZE = 8;
    static constexpr size_t SLOT_SIZE = 6;
    static constexpr uint16_t SLOT_TOMBSTONE = 0x0001;

    explicit DataPage(Page* page) : page_(page) {}

    // Largest tuple that fits on an empty page
    static size_t max_tuple_size(size_t page_size) {
        return page_size - HEADER_SIZE - SLOT_SIZE;
    }

    /**
     * Write an empty data page header (drops every slot).
     */
    void format();

    bool is_formatted() const { return page_->get_page_type() == PageType::DATA; }

    /**
     * Check the header against the layout.
     * An unformatted (zero) page passes and reads as empty.
     *
     * @return PAGE_FORMAT_ERROR for a foreign tag or out-of-bounds header
     */
    Result<void> check_format() const;

    uint16_t slot_count() const;
    uint16_t free_space_offset() const;

    // Contiguous bytes between the slot directory and the tuple area
    size_t free_space() const;

    bool can_fit(size_t tuple_size) const { return free_space() >= tuple_size + SLOT_SIZE; }

    /**
     * Insert a tuple into a new slot.
     *
     * @return The slot id, or PAGE_FULL if tuple + slot entry do not fit
     */
    Result<SlotId> insert(const char* data, size_t size);

    /**
     * Copy out a live tuple.
     *
     * @return NOT_FOUND for a tombstone or unknown slot, PAGE_FORMAT_ERROR
     *         if the slot points outside the tuple area
     */
    Result<std::string> get(SlotId slot_id) const;

    /**
     * Mark a slot as a tombstone.
     */
    Result<void> remove(SlotId slot_id);

    /**
     * Overwrite a live tuple in place when the new bytes fit the slot.
     *
     * @return true if written in place, false if the caller must relocate
     */
    Result<bool> overwrite(SlotId slot_id, const char* data, size_t size);

    bool is_live(SlotId slot_id) const;

    // Number of non-tombstoned slots
    size_t live_count() const;

private:
    struct Slot {
        uint16_t offset;
        uint16_t length;
        uint16_t flags;
    };

    Slot get_slot(size_t index) const;
    void set_slot(size_t index, const Slot& slot);
    Result<void> check_slot(const Slot& slot, SlotId slot_id) const;

    void set_slot_count(uint16_t count);
    void set_free_space_offset(uint16_t offset);

    char* data() { return page_->get_data(); }
    const char* data() const { return page_->get_data(); }

    Page* page_;
};

/**
 * IndexPage - Flat append-only entry log for one index file.
 *
 * Layout:
 *   [0]     page type (INDEX)
 *   [1]     reserved
 *   [2-3]   entry_count
 *   [4-5]   used_bytes - end of the last entry
 *   [6-7]   reserved
 *   [8+]    entries in write order: [length:2, bytes]
 *
 * There is no ordering or tree structure on disk.
 */
class IndexPage {
public:
    static constexpr size_t HEADER_SIZE = 8;
    static constexpr size_t ENTRY_HEADER_SIZE = 2;

    explicit IndexPage(Page* page) : page_(page) {}

    static size_t max_entry_size(size_t page_size) {
        return page_size - HEADER_SIZE - ENTRY_HEADER_SIZE;
    }

    void format();

    bool is_formatted() const { return page_->get_page_type() == PageType::INDEX; }

    Result<void> check_format() const;

    uint16_t entry_count() const;
    uint16_t used_bytes() const;

    size_t free_space() const;

    /**
     * Append one serialized entry.
     *
     * @return PAGE_FULL if the entry and its length prefix do not fit
     */
    Result<void> append(const std::string& entry);

    /**
     * All entries in write order.
     *
     * @return PAGE_FORMAT_ERROR if an entry runs past used_bytes
     */
    Result<std::vector<std::string>> entries() const;

private:
    char* data() { return page_->get_data(); }
    const char* data() const { return page_->get_data(); }

    Page* page_;
};

}  // namespace minirel
