#pragma once

#include <minirel/core_types.hpp>
#include <minirel/result.hpp>
#include <minirel/value.hpp>
#include <minirel/storage/buffer_pool.hpp>

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace minirel {

class TableHeap;

/**
 * TableIterator - Lazy scan over the live rows of a table heap.
 *
 * Rows come back in page order, then slot order. One page is copied out at
 * a time and unpinned before next() returns, so an open iterator holds no
 * pins. Rows appended while a scan is running may or may not be seen.
 */
class TableIterator {
public:
    explicit TableIterator(const TableHeap* heap);

    /**
     * Advance to the next live row.
     *
     * @param row Receives the decoded row
     * @param rid Receives its location (optional)
     * @return true if a row was produced, false at the end of the table
     */
    Result<bool> next(Row* row, RecordId* rid = nullptr);

    // Restart from the first page
    void reset();

private:
    Result<void> load_page(PageId page_id);

    const TableHeap* heap_;
    PageId next_page_;
    std::vector<std::pair<RecordId, std::string>> buffered_;
    size_t pos_;
};

/**
 * TableHeap - Unordered row storage over the data pages of one file.
 *
 * Rows are encoded against the table schema and stored in slotted data
 * pages. Inserts go to the current insert page; when it is full the next
 * page (or a newly allocated one) takes over. Deletes leave tombstones and
 * space is only reclaimed by delete_all().
 */
class TableHeap {
public:
    /**
     * @param name Table name (for messages)
     * @param schema Column list rows are encoded against
     * @param pool Buffer pool of the table file (not owned)
     */
    TableHeap(std::string name, Schema schema, BufferPool* pool);

    const std::string& name() const { return name_; }
    const Schema& schema() const { return schema_; }
    BufferPool* buffer_pool() const { return pool_; }

    /**
     * Append a row.
     *
     * @return Its location, SCHEMA_MISMATCH if it does not match the schema,
     *         INVALID_ARGUMENT if it cannot fit even an empty page
     */
    Result<RecordId> append(const Row& row);

    TableIterator scan() const { return TableIterator(this); }

    Result<Row> get(const RecordId& rid) const;

    /**
     * Tombstone one row.
     *
     * @return NOT_FOUND if the slot holds no live row
     */
    Result<void> remove(const RecordId& rid);

    /**
     * Empty every page of the table. The file keeps its size.
     *
     * @return Number of live rows removed
     */
    Result<size_t> delete_all();

    /**
     * Replace a row. Overwrites in place when the new encoding fits the old
     * slot, otherwise appends the new row and tombstones the old one.
     *
     * @return The row's location after the update
     */
    Result<RecordId> update_in_place(const RecordId& rid, const Row& new_row);

    PageId page_count() const { return pool_->pager()->page_count(); }

    // Number of live rows (walks every page)
    Result<size_t> row_count() const;

    /**
     * Visit every live row in scan order.
     */
    Result<void> for_each(const std::function<void(const RecordId&, const Row&)>& callback) const;

private:
    // Move the insert page forward, allocating when past the last page
    Result<PageGuard> next_insert_page();

    std::string name_;
    Schema schema_;
    BufferPool* pool_;
    PageId insert_page_;
};

}  // namespace minirel
