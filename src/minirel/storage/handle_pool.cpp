#include <minirel/storage/handle_pool.hpp>

#include <system_error>

namespace minirel {

HandlePool::HandlePool(Logger* logger)
    : logger_(logger ? logger : null_logger())
{}

HandlePool::~HandlePool() {
    auto result = close_all();
    if (!result.ok()) {
        logger_->error("Closing handle pool: " + result.error().to_string());
    }
}

std::string HandlePool::normalize(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        canonical = fs::absolute(path, ec).lexically_normal();
        if (ec) {
            return path.lexically_normal().string();
        }
    }
    return canonical.string();
}

Result<FileHandle*> HandlePool::acquire(const fs::path& path, size_t page_size, size_t capacity,
                                        EvictionPolicy policy, bool eviction_log) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string key = normalize(path);
    auto it = handles_.find(key);
    if (it != handles_.end()) {
        FileHandle* handle = it->second.get();
        if (handle->pager->page_size() != page_size) {
            return Error(ErrorCode::INVALID_ARGUMENT,
                         path.string() + " is open with page size " +
                         std::to_string(handle->pager->page_size()) + ", not " +
                         std::to_string(page_size));
        }
        handle->ref_count++;
        return handle;
    }

    if (capacity == 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Buffer pool capacity must be positive");
    }

    auto pager = Pager::open(path, page_size);
    if (!pager.ok()) {
        logger_->error("Failed to open " + path.string() + ": " + pager.error().to_string());
        return pager.error();
    }

    auto handle = std::make_unique<FileHandle>();
    handle->path = key;
    handle->pager = std::move(pager).value();
    handle->pool = std::make_unique<BufferPool>(capacity, handle->pager.get(), policy,
                                                eviction_log, logger_);
    handle->ref_count = 1;

    logger_->debug("Opened " + key + " (" + std::to_string(handle->pager->page_count()) +
                   " pages, " + std::to_string(capacity) + " frames, " +
                   eviction_policy_name(policy) + ")");

    FileHandle* raw = handle.get();
    handles_.emplace(key, std::move(handle));
    return raw;
}

Result<void> HandlePool::release(const fs::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string key = normalize(path);
    auto it = handles_.find(key);
    if (it == handles_.end()) {
        return Error(ErrorCode::NOT_FOUND, "No open handle for " + path.string());
    }

    FileHandle& handle = *it->second;
    if (handle.ref_count > 1) {
        handle.ref_count--;
        return Ok();
    }

    auto result = close_handle(handle);
    handles_.erase(it);
    return result;
}

bool HandlePool::contains(const fs::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.find(normalize(path)) != handles_.end();
}

size_t HandlePool::ref_count(const fs::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(normalize(path));
    return it == handles_.end() ? 0 : it->second->ref_count;
}

size_t HandlePool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

Result<void> HandlePool::flush_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& entry : handles_) {
        auto result = entry.second->pool->flush_all_pages();
        if (!result.ok()) {
            logger_->error("Flush of " + entry.first + " failed: " + result.error().to_string());
            return result;
        }
    }
    return Ok();
}

Result<void> HandlePool::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Close everything, report the first failure
    Result<void> first = Ok();
    for (auto& entry : handles_) {
        auto result = close_handle(*entry.second);
        if (!result.ok() && first.ok()) {
            first = result;
        }
    }
    handles_.clear();
    return first;
}

Result<void> HandlePool::close_handle(FileHandle& handle) {
    auto flushed = handle.pool->flush_all_pages();
    if (!flushed.ok()) {
        logger_->error("Flush of " + handle.path.string() + " failed: " +
                       flushed.error().to_string());
    }

    handle.pool.reset();
    auto closed = handle.pager->close();
    logger_->debug("Closed " + handle.path.string());

    if (!flushed.ok()) {
        return flushed;
    }
    return closed;
}

}  // namespace minirel
