#pragma once

#include <minirel/result.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace minirel {

namespace fs = std::filesystem;

/**
 * Catalog record of one index.
 */
struct IndexMeta {
    std::string table;
    std::string name;
    std::string column;
    std::string file;          // path of the index file
    std::string type = "BTREE";
    bool unique = false;

    bool operator==(const IndexMeta& other) const {
        return table == other.table && name == other.name && column == other.column &&
               file == other.file && type == other.type && unique == other.unique;
    }
};

void to_json(nlohmann::json& j, const IndexMeta& meta);
void from_json(const nlohmann::json& j, IndexMeta& meta);

/**
 * IndexCatalog - Where index existence is recorded.
 *
 * An index is valid only while its record exists here; an index file
 * without a record is an orphan and is never loaded.
 */
class IndexCatalog {
public:
    virtual ~IndexCatalog() = default;

    /**
     * Record a new index.
     *
     * @return ALREADY_EXISTS for a known (table, name)
     */
    virtual Result<void> add(const IndexMeta& meta) = 0;

    /**
     * Forget an index. The index file is not touched.
     *
     * @return NOT_FOUND for an unknown (table, name)
     */
    virtual Result<void> remove(const std::string& table, const std::string& name) = 0;

    virtual std::optional<IndexMeta> get(const std::string& table,
                                         const std::string& name) const = 0;

    // Indexes of one table in creation order
    virtual std::vector<IndexMeta> list(const std::string& table) const = 0;

    virtual std::vector<IndexMeta> list_all() const = 0;
};

/**
 * JsonIndexCatalog - IndexCatalog persisted as one JSON document.
 *
 * Format:
 *   {"version": 1, "indexes": [{"table": ..., "name": ..., "column": ...,
 *                               "file": ..., "type": "BTREE", "unique": false}]}
 *
 * Every change rewrites the document through a temporary file and a rename.
 */
class JsonIndexCatalog : public IndexCatalog {
public:
    static constexpr int FORMAT_VERSION = 1;

    /**
     * Load the catalog file, or start empty if it does not exist.
     *
     * @return CORRUPTION if the file exists but is not a valid catalog
     */
    static Result<std::unique_ptr<JsonIndexCatalog>> open(const fs::path& path);

    Result<void> add(const IndexMeta& meta) override;
    Result<void> remove(const std::string& table, const std::string& name) override;
    std::optional<IndexMeta> get(const std::string& table,
                                 const std::string& name) const override;
    std::vector<IndexMeta> list(const std::string& table) const override;
    std::vector<IndexMeta> list_all() const override;

    const fs::path& path() const { return path_; }

private:
    explicit JsonIndexCatalog(fs::path path);

    Result<void> load();
    Result<void> save() const;

    fs::path path_;
    std::vector<IndexMeta> entries_;
    mutable std::mutex mutex_;
};

}  // namespace minirel
