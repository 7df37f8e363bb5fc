#pragma once

#include <minirel/core_types.hpp>
#include <minirel/result.hpp>
#include <minirel/value.hpp>
#include <minirel/storage/buffer_pool.hpp>

#include <functional>
#include <string>
#include <vector>

namespace minirel {

// One persisted (key, row snapshot) pair
struct IndexEntry {
    Value key;
    Row row;
};

/**
 * IndexFile - Append-only log of index entries stored in index pages.
 *
 * Entries are written with the self-describing tagged encoding, so the
 * file can be replayed without the table schema. Replay order equals
 * write order: page order, then entry order within a page.
 */
class IndexFile {
public:
    explicit IndexFile(BufferPool* pool);

    /**
     * Append one entry, starting a new page when the last one is full.
     *
     * @return INVALID_ARGUMENT if the entry cannot fit an empty page
     */
    Result<void> append(const Value& key, const Row& row);

    /**
     * Replay every entry in write order.
     *
     * @return PAGE_FORMAT_ERROR if a page or entry does not decode
     */
    Result<void> for_each(const std::function<void(IndexEntry&&)>& callback) const;

    Result<std::vector<IndexEntry>> read_all() const;

    // Number of persisted entries (reads every page)
    Result<size_t> entry_count() const;

    PageId page_count() const { return pool_->pager()->page_count(); }

    BufferPool* buffer_pool() const { return pool_; }

private:
    Result<PageGuard> start_page();

    BufferPool* pool_;
};

// Tagged encoding of one entry: key value followed by the row
std::string encode_index_entry(const Value& key, const Row& row);

Result<IndexEntry> decode_index_entry(const std::string& bytes);

/**
 * Check that the entry for (key, row) fits an index page.
 *
 * @return INVALID_ARGUMENT if the encoded entry exceeds IndexPage::max_entry_size
 */
Result<void> check_index_entry(const Value& key, const Row& row, size_t page_size);

}  // namespace minirel
