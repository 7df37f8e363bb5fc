#include <minirel/storage_engine.hpp>
#include <minirel/index/index_file.hpp>
#include <minirel/record.hpp>

#include <cctype>
#include <system_error>

namespace minirel {

namespace {

// Table names become file names and index file name parts
Result<void> check_table_name(const std::string& name) {
    if (name.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Table name is empty");
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return Error(ErrorCode::INVALID_ARGUMENT,
                         "Table name '" + name + "' may only contain letters, digits and '_'");
        }
    }
    if (name.compare(0, 2, "__") == 0) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Table names starting with '__' are reserved");
    }
    return Ok();
}

}  // namespace

StorageEngine::~StorageEngine() {
    auto result = close();
    if (!result.ok() && result.error_code() != ErrorCode::ENGINE_NOT_OPEN) {
        logger_->error("Closing storage engine: " + result.error().to_string());
    }
}

Result<std::unique_ptr<StorageEngine>> StorageEngine::open(const Config& config) {
    auto valid = config.validate();
    if (!valid.ok()) {
        return valid.error();
    }

    auto engine = std::unique_ptr<StorageEngine>(new StorageEngine());
    engine->config_ = config;

    if (config.verbose) {
        engine->owned_logger_ = std::make_unique<ConsoleLogger>();
        engine->owned_logger_->set_min_level(LogLevel::DEBUG);
        engine->logger_ = engine->owned_logger_.get();
    } else {
        engine->logger_ = null_logger();
    }

    // Create data directory
    std::error_code ec;
    fs::create_directories(config.data_directory, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "Failed to create data directory " + config.data_directory.string() +
                     ": " + ec.message());
    }

    auto catalog = JsonIndexCatalog::open(config.data_directory / CATALOG_FILE);
    if (!catalog.ok()) {
        engine->logger_->error(catalog.error().to_string());
        return catalog.error();
    }
    engine->catalog_ = std::move(catalog).value();

    engine->handles_ = std::make_unique<HandlePool>(engine->logger_);
    engine->registry_ = std::make_unique<IndexRegistry>(
        *engine->handles_, *engine->catalog_, engine->config_, engine->logger_);
    engine->is_open_ = true;

    engine->logger_->info("Opened data directory " + config.data_directory.string() +
                          " (page size " + std::to_string(config.page_size) +
                          ", " + std::to_string(config.buffer_pool_size) + " frames, " +
                          eviction_policy_name(config.eviction_policy) + ")");
    return std::move(engine);
}

Result<void> StorageEngine::check_open() const {
    if (!is_open_) {
        return Error(ErrorCode::ENGINE_NOT_OPEN, "Storage engine is closed");
    }
    return Ok();
}

fs::path StorageEngine::table_path(const std::string& name) const {
    return config_.data_directory / (name + TABLE_EXTENSION);
}

bool StorageEngine::table_exists(const std::string& name) const {
    std::error_code ec;
    return fs::exists(table_path(name), ec);
}

Result<TableHeap*> StorageEngine::create_table(const std::string& name, const Schema& schema) {
    auto open = check_open();
    if (!open.ok()) {
        return open.error();
    }
    auto valid = check_table_name(name);
    if (!valid.ok()) {
        return valid.error();
    }
    if (table_exists(name)) {
        return Error(ErrorCode::ALREADY_EXISTS, "Table " + name + " already exists");
    }

    auto handle = handles_->acquire(table_path(name), config_.page_size,
                                    config_.buffer_pool_size, config_.eviction_policy,
                                    config_.eviction_log);
    if (!handle.ok()) {
        return handle.error();
    }

    auto heap = std::make_unique<TableHeap>(name, schema, handle.value()->pool.get());
    TableHeap* raw = heap.get();
    tables_[name] = std::move(heap);

    logger_->info("Created table " + name + " with " + std::to_string(schema.size()) + " columns");
    return raw;
}

Result<TableHeap*> StorageEngine::open_table(const std::string& name, const Schema& schema) {
    auto open = check_open();
    if (!open.ok()) {
        return open.error();
    }

    auto it = tables_.find(name);
    if (it != tables_.end()) {
        return it->second.get();
    }

    auto valid = check_table_name(name);
    if (!valid.ok()) {
        return valid.error();
    }
    if (!table_exists(name)) {
        return Error(ErrorCode::NOT_FOUND, "Table " + name + " does not exist");
    }

    auto handle = handles_->acquire(table_path(name), config_.page_size,
                                    config_.buffer_pool_size, config_.eviction_policy,
                                    config_.eviction_log);
    if (!handle.ok()) {
        return handle.error();
    }

    auto heap = std::make_unique<TableHeap>(name, schema, handle.value()->pool.get());
    TableHeap* raw = heap.get();
    tables_[name] = std::move(heap);

    logger_->debug("Opened table " + name + " (" + std::to_string(raw->page_count()) + " pages)");
    return raw;
}

Result<void> StorageEngine::drop_table(const std::string& name) {
    auto open = check_open();
    if (!open.ok()) {
        return open;
    }
    if (!table_exists(name)) {
        return Error(ErrorCode::NOT_FOUND, "Table " + name + " does not exist");
    }

    auto dropped = registry_->drop_all(name);
    if (!dropped.ok()) {
        return dropped;
    }

    auto it = tables_.find(name);
    if (it != tables_.end()) {
        tables_.erase(it);
        auto released = handles_->release(table_path(name));
        if (!released.ok()) {
            return released;
        }
    }

    std::error_code ec;
    fs::remove(table_path(name), ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "Failed to delete " + table_path(name).string() + ": " + ec.message());
    }

    logger_->info("Dropped table " + name);
    return Ok();
}

Result<RecordId> StorageEngine::insert(const std::string& table, const Row& row) {
    auto open = check_open();
    if (!open.ok()) {
        return open.error();
    }

    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return Error(ErrorCode::NOT_FOUND, "Table " + table + " is not open");
    }
    TableHeap* heap = it->second.get();

    std::vector<IndexMeta> metas = registry_->list(table);
    if (metas.empty()) {
        return heap->append(row);
    }

    // Index the row as a scan would return it
    const Schema& schema = heap->schema();
    if (row.size() != schema.size()) {
        return Error(ErrorCode::SCHEMA_MISMATCH,
                     "Row has " + std::to_string(row.size()) + " values, table " + table +
                     " has " + std::to_string(schema.size()) + " columns");
    }
    Row stored;
    stored.reserve(row.size());
    for (size_t i = 0; i < row.size(); ++i) {
        auto coerced = coerce_value(row[i], schema.column(i));
        if (!coerced.ok()) {
            return coerced.error();
        }
        stored.push_back(std::move(coerced).value());
    }

    // Every index entry must fit before the heap takes the row
    std::vector<size_t> columns;
    columns.reserve(metas.size());
    for (const auto& meta : metas) {
        auto column = schema.index_of(meta.column);
        if (!column) {
            return Error(ErrorCode::SCHEMA_MISMATCH,
                         "Index " + meta.name + " covers missing column " + meta.column);
        }
        auto fits = check_index_entry(stored[column.value()], stored, config_.page_size);
        if (!fits.ok()) {
            return Error(fits.error_code(), "Index " + meta.name + ": " + fits.error().message());
        }
        columns.push_back(column.value());
    }

    auto rid = heap->append(row);
    if (!rid.ok()) {
        return rid.error();
    }

    for (size_t i = 0; i < metas.size(); ++i) {
        const IndexMeta& meta = metas[i];
        Result<void> inserted;
        auto index = registry_->load(table, meta.name);
        if (index.ok()) {
            inserted = index.value()->insert(stored[columns[i]], stored);
        } else {
            inserted = index.error();
        }
        if (!inserted.ok()) {
            logger_->error("Index " + meta.name + " missed row " + rid.value().to_string() +
                           ": " + inserted.error().to_string());
            // Indexes written before this one keep their entry
            auto removed = heap->remove(rid.value());
            if (!removed.ok()) {
                logger_->error("Rolling back row " + rid.value().to_string() + ": " +
                               removed.error().to_string());
            }
            return inserted.error();
        }
    }

    return rid;
}

Result<BTreeIndex*> StorageEngine::create_index(const std::string& table, const std::string& column,
                                                const std::string& index_name) {
    auto open = check_open();
    if (!open.ok()) {
        return open.error();
    }

    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return Error(ErrorCode::NOT_FOUND, "Table " + table + " is not open");
    }
    return registry_->create(table, *it->second, column, index_name);
}

Result<void> StorageEngine::drop_index(const std::string& table, const std::string& index_name) {
    auto open = check_open();
    if (!open.ok()) {
        return open;
    }
    return registry_->drop(table, index_name);
}

Result<BTreeIndex*> StorageEngine::index(const std::string& table, const std::string& index_name) {
    auto open = check_open();
    if (!open.ok()) {
        return open.error();
    }
    return registry_->load(table, index_name);
}

std::optional<IndexMeta> StorageEngine::find_index_by_column(const std::string& table,
                                                             const std::string& column) const {
    if (!is_open_) {
        return std::nullopt;
    }
    return registry_->find_by_column(table, column);
}

std::vector<IndexMeta> StorageEngine::list_indexes(const std::string& table) const {
    if (!is_open_) {
        return {};
    }
    return registry_->list(table);
}

Result<BufferPoolStats> StorageEngine::table_stats(const std::string& name) const {
    auto open = check_open();
    if (!open.ok()) {
        return open.error();
    }

    auto it = tables_.find(name);
    if (it == tables_.end()) {
        return Error(ErrorCode::NOT_FOUND, "Table " + name + " is not open");
    }
    return it->second->buffer_pool()->stats();
}

Result<void> StorageEngine::flush() {
    auto open = check_open();
    if (!open.ok()) {
        return open;
    }
    return handles_->flush_all();
}

Result<void> StorageEngine::close() {
    auto open = check_open();
    if (!open.ok()) {
        return open;
    }

    auto flushed = handles_->flush_all();

    tables_.clear();
    registry_.reset();
    auto closed = handles_->close_all();
    is_open_ = false;

    logger_->info("Closed data directory " + config_.data_directory.string());

    if (!flushed.ok()) {
        return flushed;
    }
    return closed;
}

}  // namespace minirel
