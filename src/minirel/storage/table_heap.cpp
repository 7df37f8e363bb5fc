#include <minirel/storage/table_heap.hpp>
#include <minirel/record.hpp>
#include <minirel/storage/page.hpp>

namespace minirel {

// ============================================================================
// TableIterator Implementation
// ============================================================================

TableIterator::TableIterator(const TableHeap* heap)
    : heap_(heap)
    , next_page_(0)
    , pos_(0)
{}

void TableIterator::reset() {
    next_page_ = 0;
    buffered_.clear();
    pos_ = 0;
}

Result<bool> TableIterator::next(Row* row, RecordId* rid) {
    while (pos_ >= buffered_.size()) {
        if (next_page_ >= heap_->page_count()) {
            return false;
        }
        auto loaded = load_page(next_page_++);
        if (!loaded.ok()) {
            return loaded.error();
        }
    }

    const auto& entry = buffered_[pos_++];
    auto decoded = decode_row(heap_->schema(), entry.second.data(), entry.second.size());
    if (!decoded.ok()) {
        return decoded.error();
    }

    *row = std::move(decoded).value();
    if (rid) {
        *rid = entry.first;
    }
    return true;
}

Result<void> TableIterator::load_page(PageId page_id) {
    buffered_.clear();
    pos_ = 0;

    auto fetched = heap_->buffer_pool()->fetch_guarded(page_id);
    if (!fetched.ok()) {
        return fetched.error();
    }
    PageGuard guard = std::move(fetched).value();

    DataPage page(guard.get());
    auto valid = page.check_format();
    if (!valid.ok()) {
        return valid;
    }

    uint16_t count = page.slot_count();
    for (SlotId slot = 0; slot < count; ++slot) {
        if (!page.is_live(slot)) {
            continue;
        }
        auto tuple = page.get(slot);
        if (!tuple.ok()) {
            return tuple.error();
        }
        buffered_.emplace_back(RecordId(page_id, slot), std::move(tuple).value());
    }

    return Ok();
}

// ============================================================================
// TableHeap Implementation
// ============================================================================

TableHeap::TableHeap(std::string name, Schema schema, BufferPool* pool)
    : name_(std::move(name))
    , schema_(std::move(schema))
    , pool_(pool)
{
    PageId pages = page_count();
    insert_page_ = pages == 0 ? INVALID_PAGE_ID : pages - 1;
}

Result<RecordId> TableHeap::append(const Row& row) {
    auto encoded = encode_row(schema_, row);
    if (!encoded.ok()) {
        return encoded.error();
    }
    const std::string& tuple = encoded.value();

    size_t page_size = pool_->pager()->page_size();
    if (tuple.size() > DataPage::max_tuple_size(page_size)) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Row of " + std::to_string(tuple.size()) + " bytes does not fit a " +
                     std::to_string(page_size) + "-byte page of table " + name_);
    }

    PageGuard guard;
    if (insert_page_ == INVALID_PAGE_ID || insert_page_ >= page_count()) {
        auto first = next_insert_page();
        if (!first.ok()) {
            return first.error();
        }
        guard = std::move(first).value();
    } else {
        auto fetched = pool_->fetch_guarded(insert_page_);
        if (!fetched.ok()) {
            return fetched.error();
        }
        guard = std::move(fetched).value();
    }

    // A page that was just formatted always has room, so this terminates
    while (true) {
        DataPage page(guard.get());
        auto valid = page.check_format();
        if (!valid.ok()) {
            return valid.error();
        }

        auto slot = page.insert(tuple.data(), tuple.size());
        if (slot.ok()) {
            guard.mark_dirty();
            return RecordId(guard.page_id(), slot.value());
        }
        if (slot.error_code() != ErrorCode::PAGE_FULL) {
            return slot.error();
        }

        guard.release();
        auto next = next_insert_page();
        if (!next.ok()) {
            return next.error();
        }
        guard = std::move(next).value();
    }
}

Result<PageGuard> TableHeap::next_insert_page() {
    PageId candidate = insert_page_ == INVALID_PAGE_ID ? 0 : insert_page_ + 1;

    if (candidate < page_count()) {
        auto fetched = pool_->fetch_guarded(candidate);
        if (!fetched.ok()) {
            return fetched.error();
        }
        insert_page_ = candidate;
        return fetched;
    }

    auto created = pool_->new_guarded();
    if (!created.ok()) {
        return created.error();
    }
    PageGuard guard = std::move(created).value();
    DataPage(guard.get()).format();
    guard.mark_dirty();
    insert_page_ = guard.page_id();
    return std::move(guard);
}

Result<Row> TableHeap::get(const RecordId& rid) const {
    auto fetched = pool_->fetch_guarded(rid.page_id);
    if (!fetched.ok()) {
        return fetched.error();
    }
    PageGuard guard = std::move(fetched).value();

    DataPage page(guard.get());
    auto valid = page.check_format();
    if (!valid.ok()) {
        return valid.error();
    }

    auto tuple = page.get(rid.slot_id);
    if (!tuple.ok()) {
        return tuple.error();
    }
    return decode_row(schema_, tuple.value().data(), tuple.value().size());
}

Result<void> TableHeap::remove(const RecordId& rid) {
    auto fetched = pool_->fetch_guarded(rid.page_id);
    if (!fetched.ok()) {
        return fetched.error();
    }
    PageGuard guard = std::move(fetched).value();

    DataPage page(guard.get());
    auto valid = page.check_format();
    if (!valid.ok()) {
        return valid;
    }

    auto removed = page.remove(rid.slot_id);
    if (!removed.ok()) {
        return removed;
    }
    guard.mark_dirty();
    return Ok();
}

Result<size_t> TableHeap::delete_all() {
    size_t removed = 0;
    PageId pages = page_count();

    for (PageId page_id = 0; page_id < pages; ++page_id) {
        auto fetched = pool_->fetch_guarded(page_id);
        if (!fetched.ok()) {
            return fetched.error();
        }
        PageGuard guard = std::move(fetched).value();

        DataPage page(guard.get());
        auto valid = page.check_format();
        if (!valid.ok()) {
            return valid.error();
        }

        removed += page.live_count();
        page.format();
        guard.mark_dirty();
    }

    insert_page_ = pages == 0 ? INVALID_PAGE_ID : 0;
    return removed;
}

Result<RecordId> TableHeap::update_in_place(const RecordId& rid, const Row& new_row) {
    auto encoded = encode_row(schema_, new_row);
    if (!encoded.ok()) {
        return encoded.error();
    }
    const std::string& tuple = encoded.value();

    {
        auto fetched = pool_->fetch_guarded(rid.page_id);
        if (!fetched.ok()) {
            return fetched.error();
        }
        PageGuard guard = std::move(fetched).value();

        DataPage page(guard.get());
        auto valid = page.check_format();
        if (!valid.ok()) {
            return valid.error();
        }

        auto written = page.overwrite(rid.slot_id, tuple.data(), tuple.size());
        if (!written.ok()) {
            return written.error();
        }
        if (written.value()) {
            guard.mark_dirty();
            return rid;
        }
    }

    // Relocate: the new copy is written before the old one is tombstoned
    auto appended = append(new_row);
    if (!appended.ok()) {
        return appended.error();
    }

    auto removed = remove(rid);
    if (!removed.ok()) {
        return removed.error();
    }
    return appended.value();
}

Result<size_t> TableHeap::row_count() const {
    size_t live = 0;
    PageId pages = page_count();

    for (PageId page_id = 0; page_id < pages; ++page_id) {
        auto fetched = pool_->fetch_guarded(page_id);
        if (!fetched.ok()) {
            return fetched.error();
        }
        PageGuard guard = std::move(fetched).value();

        DataPage page(guard.get());
        auto valid = page.check_format();
        if (!valid.ok()) {
            return valid.error();
        }
        live += page.live_count();
    }

    return live;
}

Result<void> TableHeap::for_each(
    const std::function<void(const RecordId&, const Row&)>& callback) const {
    TableIterator it = scan();
    Row row;
    RecordId rid;

    while (true) {
        auto more = it.next(&row, &rid);
        if (!more.ok()) {
            return more.error();
        }
        if (!more.value()) {
            return Ok();
        }
        callback(rid, row);
    }
}

}  // namespace minirel
