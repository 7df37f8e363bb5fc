#include <minirel/storage/page.hpp>

namespace minirel {

namespace {

uint16_t read_u16(const char* p) {
    uint16_t v;
    std::memcpy(&v, p, sizeof(v));
    return v;
}

void write_u16(char* p, uint16_t v) {
    std::memcpy(p, &v, sizeof(v));
}

constexpr size_t OFFSET_COUNT = 2;      // slot_count / entry_count
constexpr size_t OFFSET_FREE_SPACE = 4; // free_space_offset / used_bytes

}  // namespace

// ============================================================================
// DataPage Implementation
// ============================================================================

void DataPage::format() {
    std::memset(data(), 0, HEADER_SIZE);
    data()[0] = static_cast<char>(PageType::DATA);
    set_slot_count(0);
    set_free_space_offset(static_cast<uint16_t>(page_->size()));
}

Result<void> DataPage::check_format() const {
    PageType type = page_->get_page_type();
    if (type == PageType::UNFORMATTED) {
        return Ok();
    }
    if (type != PageType::DATA) {
        return Error(ErrorCode::PAGE_FORMAT_ERROR,
                     "Page " + std::to_string(page_->get_page_id()) +
                     " has type tag " + std::to_string(static_cast<int>(type)) +
                     ", expected a data page");
    }

    size_t dir_end = HEADER_SIZE + static_cast<size_t>(slot_count()) * SLOT_SIZE;
    size_t free_off = free_space_offset();
    if (dir_end > free_off || free_off > page_->size()) {
        return Error(ErrorCode::PAGE_FORMAT_ERROR,
                     "Page " + std::to_string(page_->get_page_id()) +
                     " slot directory overlaps tuple area");
    }
    return Ok();
}

uint16_t DataPage::slot_count() const {
    return read_u16(data() + OFFSET_COUNT);
}

void DataPage::set_slot_count(uint16_t count) {
    write_u16(data() + OFFSET_COUNT, count);
}

uint16_t DataPage::free_space_offset() const {
    return read_u16(data() + OFFSET_FREE_SPACE);
}

void DataPage::set_free_space_offset(uint16_t offset) {
    write_u16(data() + OFFSET_FREE_SPACE, offset);
}

size_t DataPage::free_space() const {
    if (!is_formatted()) {
        return page_->size() - HEADER_SIZE;
    }

    size_t dir_end = HEADER_SIZE + static_cast<size_t>(slot_count()) * SLOT_SIZE;
    size_t free_off = free_space_offset();

    // Prevent underflow on corrupted pages
    if (free_off < dir_end) {
        return 0;
    }
    return free_off - dir_end;
}

DataPage::Slot DataPage::get_slot(size_t index) const {
    const char* d = data() + HEADER_SIZE + index * SLOT_SIZE;
    Slot slot;
    slot.offset = read_u16(d);
    slot.length = read_u16(d + 2);
    slot.flags = read_u16(d + 4);
    return slot;
}

void DataPage::set_slot(size_t index, const Slot& slot) {
    char* d = data() + HEADER_SIZE + index * SLOT_SIZE;
    write_u16(d, slot.offset);
    write_u16(d + 2, slot.length);
    write_u16(d + 4, slot.flags);
}

Result<void> DataPage::check_slot(const Slot& slot, SlotId slot_id) const {
    size_t end = static_cast<size_t>(slot.offset) + slot.length;
    if (slot.offset < free_space_offset() || end > page_->size()) {
        return Error(ErrorCode::PAGE_FORMAT_ERROR,
                     "Slot " + std::to_string(slot_id) + " of page " +
                     std::to_string(page_->get_page_id()) + " points outside the tuple area");
    }
    return Ok();
}

Result<SlotId> DataPage::insert(const char* tuple, size_t size) {
    if (!is_formatted()) {
        format();
    }

    if (!can_fit(size)) {
        return Error(ErrorCode::PAGE_FULL,
                     "Page " + std::to_string(page_->get_page_id()) + " has " +
                     std::to_string(free_space()) + " free bytes, tuple needs " +
                     std::to_string(size + SLOT_SIZE));
    }

    uint16_t count = slot_count();
    uint16_t offset = static_cast<uint16_t>(free_space_offset() - size);

    std::memcpy(data() + offset, tuple, size);

    Slot slot;
    slot.offset = offset;
    slot.length = static_cast<uint16_t>(size);
    slot.flags = 0;
    set_slot(count, slot);

    set_free_space_offset(offset);
    set_slot_count(static_cast<uint16_t>(count + 1));

    return static_cast<SlotId>(count);
}

Result<std::string> DataPage::get(SlotId slot_id) const {
    if (!is_formatted() || slot_id >= slot_count()) {
        return Error(ErrorCode::NOT_FOUND, "No slot " + std::to_string(slot_id));
    }

    Slot slot = get_slot(slot_id);
    if (slot.flags & SLOT_TOMBSTONE) {
        return Error(ErrorCode::NOT_FOUND, "Slot " + std::to_string(slot_id) + " is deleted");
    }

    auto valid = check_slot(slot, slot_id);
    if (!valid.ok()) {
        return valid.error();
    }

    return std::string(data() + slot.offset, slot.length);
}

Result<void> DataPage::remove(SlotId slot_id) {
    if (!is_live(slot_id)) {
        return Error(ErrorCode::NOT_FOUND, "No live tuple in slot " + std::to_string(slot_id));
    }

    Slot slot = get_slot(slot_id);
    slot.flags |= SLOT_TOMBSTONE;
    set_slot(slot_id, slot);
    return Ok();
}

Result<bool> DataPage::overwrite(SlotId slot_id, const char* tuple, size_t size) {
    if (!is_live(slot_id)) {
        return Error(ErrorCode::NOT_FOUND, "No live tuple in slot " + std::to_string(slot_id));
    }

    Slot slot = get_slot(slot_id);
    auto valid = check_slot(slot, slot_id);
    if (!valid.ok()) {
        return valid.error();
    }

    if (size > slot.length) {
        return false;
    }

    std::memcpy(data() + slot.offset, tuple, size);
    slot.length = static_cast<uint16_t>(size);
    set_slot(slot_id, slot);
    return true;
}

bool DataPage::is_live(SlotId slot_id) const {
    if (!is_formatted() || slot_id >= slot_count()) {
        return false;
    }
    return (get_slot(slot_id).flags & SLOT_TOMBSTONE) == 0;
}

size_t DataPage::live_count() const {
    if (!is_formatted()) {
        return 0;
    }
    size_t live = 0;
    uint16_t count = slot_count();
    for (uint16_t i = 0; i < count; ++i) {
        if ((get_slot(i).flags & SLOT_TOMBSTONE) == 0) {
            ++live;
        }
    }
    return live;
}

// ============================================================================
// IndexPage Implementation
// ============================================================================

void IndexPage::format() {
    std::memset(data(), 0, HEADER_SIZE);
    data()[0] = static_cast<char>(PageType::INDEX);
    write_u16(data() + OFFSET_COUNT, 0);
    write_u16(data() + OFFSET_FREE_SPACE, static_cast<uint16_t>(HEADER_SIZE));
}

Result<void> IndexPage::check_format() const {
    PageType type = page_->get_page_type();
    if (type == PageType::UNFORMATTED) {
        return Ok();
    }
    if (type != PageType::INDEX) {
        return Error(ErrorCode::PAGE_FORMAT_ERROR,
                     "Page " + std::to_string(page_->get_page_id()) +
                     " has type tag " + std::to_string(static_cast<int>(type)) +
                     ", expected an index page");
    }

    size_t used = used_bytes();
    if (used < HEADER_SIZE || used > page_->size()) {
        return Error(ErrorCode::PAGE_FORMAT_ERROR,
                     "Index page " + std::to_string(page_->get_page_id()) +
                     " claims " + std::to_string(used) + " used bytes");
    }
    return Ok();
}

uint16_t IndexPage::entry_count() const {
    return is_formatted() ? read_u16(data() + OFFSET_COUNT) : 0;
}

uint16_t IndexPage::used_bytes() const {
    return is_formatted() ? read_u16(data() + OFFSET_FREE_SPACE)
                          : static_cast<uint16_t>(HEADER_SIZE);
}

size_t IndexPage::free_space() const {
    size_t used = used_bytes();
    return used >= page_->size() ? 0 : page_->size() - used;
}

Result<void> IndexPage::append(const std::string& entry) {
    if (!is_formatted()) {
        format();
    }

    size_t need = ENTRY_HEADER_SIZE + entry.size();
    if (need > free_space()) {
        return Error(ErrorCode::PAGE_FULL,
                     "Index page " + std::to_string(page_->get_page_id()) + " cannot fit " +
                     std::to_string(need) + " bytes");
    }

    uint16_t used = used_bytes();
    write_u16(data() + used, static_cast<uint16_t>(entry.size()));
    std::memcpy(data() + used + ENTRY_HEADER_SIZE, entry.data(), entry.size());

    write_u16(data() + OFFSET_FREE_SPACE, static_cast<uint16_t>(used + need));
    write_u16(data() + OFFSET_COUNT, static_cast<uint16_t>(entry_count() + 1));
    return Ok();
}

Result<std::vector<std::string>> IndexPage::entries() const {
    std::vector<std::string> out;

    auto valid = check_format();
    if (!valid.ok()) {
        return valid.error();
    }
    if (!is_formatted()) {
        return out;
    }

    size_t pos = HEADER_SIZE;
    size_t used = used_bytes();
    uint16_t count = entry_count();
    out.reserve(count);

    for (uint16_t i = 0; i < count; ++i) {
        if (pos + ENTRY_HEADER_SIZE > used) {
            return Error(ErrorCode::PAGE_FORMAT_ERROR,
                         "Index page " + std::to_string(page_->get_page_id()) +
                         " truncated at entry " + std::to_string(i));
        }
        size_t len = read_u16(data() + pos);
        pos += ENTRY_HEADER_SIZE;
        if (pos + len > used) {
            return Error(ErrorCode::PAGE_FORMAT_ERROR,
                         "Index page " + std::to_string(page_->get_page_id()) +
                         " entry " + std::to_string(i) + " runs past used bytes");
        }
        out.emplace_back(data() + pos, len);
        pos += len;
    }

    if (pos != used) {
        return Error(ErrorCode::PAGE_FORMAT_ERROR,
                     "Index page " + std::to_string(page_->get_page_id()) +
                     " entry count disagrees with used bytes");
    }
    return out;
}

}  // namespace minirel
