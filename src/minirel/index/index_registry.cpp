#include <minirel/index/index_registry.hpp>

#include <system_error>

namespace minirel {

IndexRegistry::IndexRegistry(HandlePool& handles, IndexCatalog& catalog, const Config& config,
                             Logger* logger)
    : handles_(handles)
    , catalog_(catalog)
    , config_(config)
    , logger_(logger ? logger : null_logger())
{}

IndexRegistry::~IndexRegistry() {
    while (!loaded_.empty()) {
        Key key = loaded_.begin()->first;
        auto result = unload(key);
        if (!result.ok()) {
            logger_->error("Unloading index " + key.first + "." + key.second + ": " +
                           result.error().to_string());
        }
    }
}

std::string IndexRegistry::index_file_name(const std::string& table,
                                           const std::string& index_name) {
    return "__idx__" + table + "__" + index_name + ".idx";
}

Result<FileHandle*> IndexRegistry::acquire(const fs::path& path) {
    return handles_.acquire(path, config_.page_size, config_.buffer_pool_size,
                            config_.eviction_policy, config_.eviction_log);
}

Result<void> IndexRegistry::unload(const Key& key) {
    auto it = loaded_.find(key);
    if (it == loaded_.end()) {
        return Ok();
    }

    fs::path path = it->second->handle()->path;
    loaded_.erase(it);
    return handles_.release(path);
}

Result<BTreeIndex*> IndexRegistry::create(const std::string& table, const TableHeap& heap,
                                          const std::string& column,
                                          const std::string& index_name) {
    std::string name = index_name.empty() ? "idx_" + column : index_name;

    if (catalog_.get(table, name)) {
        return Error(ErrorCode::ALREADY_EXISTS, "Index " + name + " already exists on " + table);
    }

    auto column_index = heap.schema().index_of(column);
    if (!column_index) {
        return Error(ErrorCode::NOT_FOUND, "Table " + table + " has no column " + column);
    }

    IndexMeta meta;
    meta.table = table;
    meta.name = name;
    meta.column = column;
    meta.file = (config_.data_directory / index_file_name(table, name)).string();

    // A file left behind by an earlier drop would replay stale entries
    std::error_code ec;
    if (fs::exists(meta.file, ec) && !handles_.contains(meta.file)) {
        logger_->warning("Replacing orphaned index file " + meta.file);
        fs::remove(meta.file, ec);
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                         "Failed to remove orphaned index file " + meta.file + ": " + ec.message());
        }
    }

    auto handle = acquire(meta.file);
    if (!handle.ok()) {
        return handle.error();
    }

    auto index = std::make_unique<BTreeIndex>(meta, handle.value(), config_.btree_order, logger_);

    // Any failure past this point leaves no file and no catalog record
    auto abandon = [&](const Error& error) -> Error {
        index.reset();
        auto released = handles_.release(meta.file);
        if (!released.ok()) {
            logger_->error("Releasing " + meta.file + ": " + released.error().to_string());
        }
        std::error_code remove_ec;
        fs::remove(meta.file, remove_ec);
        logger_->error("Create index " + table + "." + name + " failed: " + error.to_string());
        return error;
    };

    size_t col = column_index.value();
    TableIterator it = heap.scan();
    Row row;
    size_t entries = 0;
    while (true) {
        auto more = it.next(&row);
        if (!more.ok()) {
            return abandon(more.error());
        }
        if (!more.value()) {
            break;
        }
        auto inserted = index->insert(row[col], row);
        if (!inserted.ok()) {
            return abandon(inserted.error());
        }
        ++entries;
    }

    auto flushed = index->flush();
    if (!flushed.ok()) {
        return abandon(flushed.error());
    }

    auto added = catalog_.add(meta);
    if (!added.ok()) {
        return abandon(added.error());
    }

    logger_->info("Created index " + name + " on " + table + "(" + column + ") with " +
                  std::to_string(entries) + " entries");

    BTreeIndex* raw = index.get();
    loaded_[Key(table, name)] = std::move(index);
    return raw;
}

Result<void> IndexRegistry::drop(const std::string& table, const std::string& index_name) {
    auto removed = catalog_.remove(table, index_name);
    if (!removed.ok()) {
        return removed;
    }

    auto unloaded = unload(Key(table, index_name));
    logger_->info("Dropped index " + index_name + " on " + table);
    return unloaded;
}

Result<void> IndexRegistry::drop_all(const std::string& table) {
    for (const auto& meta : catalog_.list(table)) {
        auto result = drop(table, meta.name);
        if (!result.ok()) {
            return result;
        }
    }
    return Ok();
}

Result<BTreeIndex*> IndexRegistry::load(const std::string& table, const std::string& index_name) {
    auto it = loaded_.find(Key(table, index_name));
    if (it != loaded_.end()) {
        auto built = it->second->ensure_built();
        if (!built.ok()) {
            return built.error();
        }
        return it->second.get();
    }

    auto meta = catalog_.get(table, index_name);
    if (!meta) {
        return Error(ErrorCode::NOT_FOUND, "No index " + index_name + " on " + table);
    }

    auto handle = acquire(meta->file);
    if (!handle.ok()) {
        return handle.error();
    }

    auto index = std::make_unique<BTreeIndex>(*meta, handle.value(), config_.btree_order, logger_);
    auto built = index->ensure_built();
    if (!built.ok()) {
        index.reset();
        auto released = handles_.release(meta->file);
        if (!released.ok()) {
            logger_->error("Releasing " + meta->file + ": " + released.error().to_string());
        }
        return built.error();
    }

    BTreeIndex* raw = index.get();
    loaded_[Key(table, index_name)] = std::move(index);
    return raw;
}

std::optional<IndexMeta> IndexRegistry::find_by_column(const std::string& table,
                                                       const std::string& column) const {
    for (const auto& meta : catalog_.list(table)) {
        if (meta.column == column) {
            return meta;
        }
    }
    return std::nullopt;
}

std::vector<IndexMeta> IndexRegistry::list(const std::string& table) const {
    return catalog_.list(table);
}

Result<void> IndexRegistry::mark_unloaded(const std::string& table, const std::string& index_name) {
    return unload(Key(table, index_name));
}

bool IndexRegistry::is_loaded(const std::string& table, const std::string& index_name) const {
    auto it = loaded_.find(Key(table, index_name));
    return it != loaded_.end() && it->second->is_built();
}

Result<void> IndexRegistry::flush() {
    for (auto& entry : loaded_) {
        auto result = entry.second->flush();
        if (!result.ok()) {
            return result;
        }
    }
    return Ok();
}

}  // namespace minirel
