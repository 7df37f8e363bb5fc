#pragma once

#include <minirel/result.hpp>
#include <minirel/types.hpp>
#include <minirel/index/btree_index.hpp>
#include <minirel/index/index_catalog.hpp>
#include <minirel/storage/handle_pool.hpp>
#include <minirel/storage/table_heap.hpp>
#include <minirel/util/logger.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace minirel {

namespace fs = std::filesystem;

/**
 * IndexRegistry - Maps (table, index name) to loaded BTreeIndex instances.
 *
 * Existence is decided by the IndexCatalog; the registry only caches the
 * trees it has built this session. A tree is built from its file on the
 * first load() and kept until drop() or mark_unloaded().
 */
class IndexRegistry {
public:
    /**
     * @param handles Handle pool the index files are opened through
     * @param catalog Persistent index records
     * @param config Data directory, page size, pool size, policy and order
     * @param logger Destination for create/drop/build messages
     */
    IndexRegistry(HandlePool& handles, IndexCatalog& catalog, const Config& config,
                  Logger* logger = null_logger());

    // Releases the handles of every loaded index
    ~IndexRegistry();

    IndexRegistry(const IndexRegistry&) = delete;
    IndexRegistry& operator=(const IndexRegistry&) = delete;

    /**
     * Build a new index over one column of a table.
     * Scans the heap, persists one entry per row, flushes and records the
     * index in the catalog.
     *
     * @param index_name Defaults to "idx_<column>" when empty
     * @return ALREADY_EXISTS for a registered (table, name), NOT_FOUND for
     *         an unknown column
     */
    Result<BTreeIndex*> create(const std::string& table, const TableHeap& heap,
                               const std::string& column, const std::string& index_name);

    /**
     * Remove the catalog record and the in-memory tree.
     * The index file stays on disk.
     *
     * @return NOT_FOUND if the index is not registered
     */
    Result<void> drop(const std::string& table, const std::string& index_name);

    // Drop every index of a table
    Result<void> drop_all(const std::string& table);

    /**
     * Return the loaded index, building it from its file on first use.
     *
     * @return NOT_FOUND if the index is not registered
     */
    Result<BTreeIndex*> load(const std::string& table, const std::string& index_name);

    std::optional<IndexMeta> find_by_column(const std::string& table,
                                            const std::string& column) const;

    std::vector<IndexMeta> list(const std::string& table) const;

    /**
     * Discard the in-memory tree; the next load() rebuilds it from the file.
     */
    Result<void> mark_unloaded(const std::string& table, const std::string& index_name);

    bool is_loaded(const std::string& table, const std::string& index_name) const;

    // Write back the dirty pages of every loaded index
    Result<void> flush();

    /**
     * File name of an index: "__idx__<table>__<name>.idx".
     */
    static std::string index_file_name(const std::string& table, const std::string& index_name);

private:
    using Key = std::pair<std::string, std::string>;

    Result<FileHandle*> acquire(const fs::path& path);

    // Erase a loaded entry and release its handle
    Result<void> unload(const Key& key);

    HandlePool& handles_;
    IndexCatalog& catalog_;
    Config config_;
    Logger* logger_;
    std::map<Key, std::unique_ptr<BTreeIndex>> loaded_;
};

}  // namespace minirel
