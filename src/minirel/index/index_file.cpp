#include <minirel/index/index_file.hpp>
#include <minirel/record.hpp>
#include <minirel/storage/page.hpp>
#include <minirel/util/serializer.hpp>

namespace minirel {

std::string encode_index_entry(const Value& key, const Row& row) {
    BinaryWriter writer;
    encode_tagged_value(key, writer);
    encode_tagged_row(row, writer);
    return writer.release();
}

Result<IndexEntry> decode_index_entry(const std::string& bytes) {
    BinaryReader reader(bytes);
    IndexEntry entry;

    if (!decode_tagged_value(reader, &entry.key) ||
        !decode_tagged_row(reader, &entry.row) ||
        reader.remaining() != 0) {
        return Error(ErrorCode::PAGE_FORMAT_ERROR,
                     "Malformed index entry of " + std::to_string(bytes.size()) + " bytes");
    }
    return entry;
}

namespace {

Result<void> check_entry_size(size_t entry_size, size_t page_size) {
    if (entry_size > IndexPage::max_entry_size(page_size)) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Index entry of " + std::to_string(entry_size) +
                     " bytes does not fit a " + std::to_string(page_size) + "-byte page");
    }
    return Ok();
}

}  // namespace

Result<void> check_index_entry(const Value& key, const Row& row, size_t page_size) {
    return check_entry_size(encode_index_entry(key, row).size(), page_size);
}

IndexFile::IndexFile(BufferPool* pool)
    : pool_(pool)
{}

Result<PageGuard> IndexFile::start_page() {
    auto created = pool_->new_guarded();
    if (!created.ok()) {
        return created.error();
    }
    PageGuard guard = std::move(created).value();
    IndexPage(guard.get()).format();
    guard.mark_dirty();
    return std::move(guard);
}

Result<void> IndexFile::append(const Value& key, const Row& row) {
    std::string entry = encode_index_entry(key, row);

    auto fits = check_entry_size(entry.size(), pool_->pager()->page_size());
    if (!fits.ok()) {
        return fits;
    }

    PageId pages = page_count();
    PageGuard guard;
    if (pages == 0) {
        auto first = start_page();
        if (!first.ok()) {
            return first.error();
        }
        guard = std::move(first).value();
    } else {
        auto fetched = pool_->fetch_guarded(pages - 1);
        if (!fetched.ok()) {
            return fetched.error();
        }
        guard = std::move(fetched).value();
    }

    IndexPage page(guard.get());
    auto valid = page.check_format();
    if (!valid.ok()) {
        return valid;
    }

    auto appended = page.append(entry);
    if (appended.ok()) {
        guard.mark_dirty();
        return Ok();
    }
    if (appended.error_code() != ErrorCode::PAGE_FULL) {
        return appended;
    }

    guard.release();
    auto next = start_page();
    if (!next.ok()) {
        return next.error();
    }
    guard = std::move(next).value();

    auto retried = IndexPage(guard.get()).append(entry);
    if (!retried.ok()) {
        return retried;
    }
    guard.mark_dirty();
    return Ok();
}

Result<void> IndexFile::for_each(const std::function<void(IndexEntry&&)>& callback) const {
    PageId pages = page_count();

    for (PageId page_id = 0; page_id < pages; ++page_id) {
        std::vector<std::string> raw;
        {
            auto fetched = pool_->fetch_guarded(page_id);
            if (!fetched.ok()) {
                return fetched.error();
            }
            PageGuard guard = std::move(fetched).value();

            auto entries = IndexPage(guard.get()).entries();
            if (!entries.ok()) {
                return entries.error();
            }
            raw = std::move(entries).value();
        }

        for (const std::string& bytes : raw) {
            auto entry = decode_index_entry(bytes);
            if (!entry.ok()) {
                return Error(ErrorCode::PAGE_FORMAT_ERROR,
                             "Index page " + std::to_string(page_id) + ": " +
                             entry.error().message());
            }
            callback(std::move(entry).value());
        }
    }

    return Ok();
}

Result<std::vector<IndexEntry>> IndexFile::read_all() const {
    std::vector<IndexEntry> out;
    auto result = for_each([&out](IndexEntry&& entry) {
        out.push_back(std::move(entry));
    });
    if (!result.ok()) {
        return result.error();
    }
    return out;
}

Result<size_t> IndexFile::entry_count() const {
    size_t count = 0;
    PageId pages = page_count();

    for (PageId page_id = 0; page_id < pages; ++page_id) {
        auto fetched = pool_->fetch_guarded(page_id);
        if (!fetched.ok()) {
            return fetched.error();
        }
        PageGuard guard = std::move(fetched).value();

        IndexPage page(guard.get());
        auto valid = page.check_format();
        if (!valid.ok()) {
            return valid.error();
        }
        count += page.entry_count();
    }
    return count;
}

}  // namespace minirel
