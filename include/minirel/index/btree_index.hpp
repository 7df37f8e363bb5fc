#pragma once

#include <minirel/result.hpp>
#include <minirel/value.hpp>
#include <minirel/index/bplus_tree.hpp>
#include <minirel/index/index_catalog.hpp>
#include <minirel/index/index_file.hpp>
#include <minirel/storage/handle_pool.hpp>
#include <minirel/util/logger.hpp>

#include <optional>
#include <vector>

namespace minirel {

/**
 * BTreeIndex - Single-column index: persisted entry log + in-memory tree.
 *
 * The tree is not stored on disk. The first lookup of a session replays
 * the index file into a fresh BPlusTree; inserts go to the file first and
 * then to the tree. Stored rows are snapshots and do not follow later
 * updates or deletes of the table.
 */
class BTreeIndex {
public:
    /**
     * @param meta Catalog record of the index
     * @param handle Open handle of the index file (not owned)
     * @param order B+ tree order
     * @param logger Destination for build messages
     */
    BTreeIndex(IndexMeta meta, FileHandle* handle, size_t order,
               Logger* logger = null_logger());

    const IndexMeta& meta() const { return meta_; }

    FileHandle* handle() const { return handle_; }

    /**
     * Replay the index file into the tree unless it is already built.
     */
    Result<void> ensure_built();

    bool is_built() const { return built_; }

    /**
     * Discard the tree and replay the file now.
     */
    Result<void> rebuild();

    // Next ensure_built() replays the file again
    void mark_stale() { built_ = false; }

    /**
     * Persist one entry and add it to the tree.
     */
    Result<void> insert(const Value& key, const Row& row);

    Result<std::vector<Row>> find(const Value& key);

    /**
     * Lazy range scan; the iterator is invalidated by the next insert.
     */
    Result<RangeIterator> range(const std::optional<Value>& lower,
                                const std::optional<Value>& upper,
                                bool lower_inclusive = true,
                                bool upper_inclusive = true);

    Result<std::vector<Row>> range_rows(const std::optional<Value>& lower,
                                        const std::optional<Value>& upper,
                                        bool lower_inclusive = true,
                                        bool upper_inclusive = true);

    // Write back the index file's dirty pages
    Result<void> flush();

    const BPlusTree& tree() const { return tree_; }

    IndexFile& file() { return file_; }

private:
    IndexMeta meta_;
    FileHandle* handle_;
    IndexFile file_;
    BPlusTree tree_;
    bool built_;
    Logger* logger_;
};

}  // namespace minirel
