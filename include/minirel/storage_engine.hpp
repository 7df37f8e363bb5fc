#pragma once

#include <minirel/result.hpp>
#include <minirel/types.hpp>
#include <minirel/value.hpp>
#include <minirel/index/btree_index.hpp>
#include <minirel/index/index_catalog.hpp>
#include <minirel/index/index_registry.hpp>
#include <minirel/storage/buffer_pool.hpp>
#include <minirel/storage/handle_pool.hpp>
#include <minirel/storage/table_heap.hpp>
#include <minirel/util/logger.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace minirel {

/**
 * StorageEngine - Entry point over one data directory.
 *
 * Owns the handle pool, the index catalog and the index registry, and
 * hands out one TableHeap per open table. Files in the directory:
 *   <table>.tbl                     data pages of a table
 *   __idx__<table>__<index>.idx     index entry log
 *   indexes.json                    index catalog
 *
 * Table schemas are supplied by the caller on every open; the engine does
 * not persist them.
 */
class StorageEngine {
public:
    static constexpr const char* TABLE_EXTENSION = ".tbl";
    static constexpr const char* CATALOG_FILE = "indexes.json";

    /**
     * Open or create a data directory.
     *
     * @param config Engine configuration
     * @return The opened engine, INVALID_ARGUMENT for a bad config,
     *         CORRUPTION for an unreadable index catalog
     */
    static Result<std::unique_ptr<StorageEngine>> open(const Config& config);

    /**
     * Destructor - ensures close is called.
     */
    ~StorageEngine();

    StorageEngine(const StorageEngine&) = delete;
    StorageEngine& operator=(const StorageEngine&) = delete;

    // ========================================================================
    // Tables
    // ========================================================================

    /**
     * Create an empty table file.
     *
     * @return ALREADY_EXISTS if the table file exists
     */
    Result<TableHeap*> create_table(const std::string& name, const Schema& schema);

    /**
     * Open an existing table. Repeated opens return the same heap.
     *
     * @return NOT_FOUND if the table file does not exist
     */
    Result<TableHeap*> open_table(const std::string& name, const Schema& schema);

    /**
     * Close and delete a table file. Its indexes are dropped from the
     * catalog; their files remain.
     */
    Result<void> drop_table(const std::string& name);

    bool table_exists(const std::string& name) const;

    /**
     * Append a row and add it to every index of the table.
     *
     * @return NOT_FOUND if the table is not open
     */
    Result<RecordId> insert(const std::string& table, const Row& row);

    // ========================================================================
    // Indexes
    // ========================================================================

    Result<BTreeIndex*> create_index(const std::string& table, const std::string& column,
                                     const std::string& index_name = "");

    Result<void> drop_index(const std::string& table, const std::string& index_name);

    // Loaded index, built on first access
    Result<BTreeIndex*> index(const std::string& table, const std::string& index_name);

    std::optional<IndexMeta> find_index_by_column(const std::string& table,
                                                  const std::string& column) const;

    std::vector<IndexMeta> list_indexes(const std::string& table) const;

    // ========================================================================
    // Maintenance
    // ========================================================================

    // Buffer pool counters of an open table
    Result<BufferPoolStats> table_stats(const std::string& name) const;

    /**
     * Write back every dirty page of every open file.
     */
    Result<void> flush();

    /**
     * Flush and close everything. Further calls fail with ENGINE_NOT_OPEN.
     */
    Result<void> close();

    bool is_open() const { return is_open_; }

    const Config& config() const { return config_; }

    fs::path table_path(const std::string& name) const;

    HandlePool& handles() { return *handles_; }
    IndexRegistry& indexes() { return *registry_; }

private:
    StorageEngine() = default;

    Result<void> check_open() const;

    Config config_;
    std::unique_ptr<Logger> owned_logger_;
    Logger* logger_ = nullptr;

    // Declaration order is teardown order in reverse: tables and the
    // registry release their handles before the pool goes away
    std::unique_ptr<HandlePool> handles_;
    std::unique_ptr<JsonIndexCatalog> catalog_;
    std::unique_ptr<IndexRegistry> registry_;
    std::map<std::string, std::unique_ptr<TableHeap>> tables_;

    bool is_open_ = false;
};

}  // namespace minirel
