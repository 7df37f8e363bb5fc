#include <minirel/storage/pager.hpp>

#include <utility>
#include <vector>

namespace minirel {

Result<std::unique_ptr<Pager>> Pager::open(const fs::path& path, size_t page_size) {
    if (page_size < MIN_PAGE_SIZE || page_size > MAX_PAGE_SIZE) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Unsupported page size " + std::to_string(page_size));
    }

    auto pager = std::unique_ptr<Pager>(new Pager(path, page_size));
    auto result = pager->open_file();
    if (!result.ok()) {
        return result.error();
    }
    return std::move(pager);
}

Pager::Pager(const fs::path& path, size_t page_size)
    : path_(path)
    , page_size_(page_size)
    , num_pages_(0)
    , is_open_(false)
{}

Pager::~Pager() {
    if (is_open_) {
        file_.flush();
        file_.close();
    }
}

Result<void> Pager::open_file() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    bool file_exists = fs::exists(path_, ec);

    if (file_exists) {
        uint64_t size = fs::file_size(path_, ec);
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                         "Failed to stat " + path_.string() + ": " + ec.message());
        }
        if (size % page_size_ != 0) {
            return Error(ErrorCode::PAGE_FORMAT_ERROR,
                         path_.string() + " has size " + std::to_string(size) +
                         ", not a multiple of page size " + std::to_string(page_size_));
        }

        file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
        if (!file_.is_open()) {
            return Error(ErrorCode::IO_ERROR, "Failed to open page file " + path_.string());
        }
        num_pages_ = static_cast<PageId>(size / page_size_);
    } else {
        if (path_.has_parent_path()) {
            fs::create_directories(path_.parent_path(), ec);
            if (ec) {
                return Error(ErrorCode::IO_ERROR,
                             "Failed to create directory for " + path_.string() + ": " + ec.message());
            }
        }
        file_.open(path_, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file_.is_open()) {
            return Error(ErrorCode::IO_ERROR, "Failed to create page file " + path_.string());
        }
        num_pages_ = 0;
    }

    is_open_ = true;
    return Ok();
}

Result<void> Pager::read_page(PageId page_id, char* data) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_) {
        return Error(ErrorCode::IO_ERROR, "Page file is closed");
    }

    if (!data) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Null data buffer");
    }

    if (page_id == INVALID_PAGE_ID || page_id >= num_pages_) {
        return Error(ErrorCode::OUT_OF_RANGE,
                     "Page " + std::to_string(page_id) + " beyond end of " +
                     path_.filename().string() + " (" + std::to_string(num_pages_) + " pages)");
    }

    file_.seekg(static_cast<std::streamoff>(get_file_offset(page_id)));
    file_.read(data, static_cast<std::streamsize>(page_size_));

    if (!file_.good()) {
        file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to read page " + std::to_string(page_id));
    }

    return Ok();
}

Result<void> Pager::write_page(PageId page_id, const char* data, size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_) {
        return Error(ErrorCode::IO_ERROR, "Page file is closed");
    }

    if (!data || size != page_size_) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Page writes must be exactly " + std::to_string(page_size_) + " bytes");
    }

    // Only allocated pages may be written; allocate_page() is the one
    // operation that extends the file
    if (page_id == INVALID_PAGE_ID || page_id >= num_pages_) {
        return Error(ErrorCode::OUT_OF_RANGE,
                     "Cannot write unallocated page " + std::to_string(page_id));
    }

    file_.seekp(static_cast<std::streamoff>(get_file_offset(page_id)));
    file_.write(data, static_cast<std::streamsize>(page_size_));

    if (!file_.good()) {
        file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to write page " + std::to_string(page_id));
    }

    return Ok();
}

Result<PageId> Pager::allocate_page() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_) {
        return Error(ErrorCode::IO_ERROR, "Page file is closed");
    }

    if (num_pages_ == INVALID_PAGE_ID - 1) {
        return Error(ErrorCode::ALLOCATION_ERROR, "Page id space exhausted");
    }

    PageId page_id = num_pages_;
    std::vector<char> zero_page(page_size_, 0);

    file_.seekp(static_cast<std::streamoff>(get_file_offset(page_id)));
    file_.write(zero_page.data(), static_cast<std::streamsize>(page_size_));
    file_.flush();

    if (!file_.good()) {
        file_.clear();
        // Drop any partial extension so the size stays a page multiple
        std::error_code ec;
        fs::resize_file(path_, get_file_offset(page_id), ec);
        return Error(ErrorCode::ALLOCATION_ERROR,
                     "Failed to extend " + path_.filename().string() + " by one page");
    }

    ++num_pages_;
    return page_id;
}

PageId Pager::page_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return num_pages_;
}

Result<void> Pager::flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_) {
        return Ok();
    }

    file_.flush();
    if (!file_.good()) {
        file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to flush " + path_.string());
    }

    return Ok();
}

Result<void> Pager::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_) {
        return Ok();
    }

    file_.flush();
    bool flushed = file_.good();
    file_.close();
    is_open_ = false;

    if (!flushed) {
        return Error(ErrorCode::IO_ERROR, "Failed to flush " + path_.string() + " on close");
    }
    return Ok();
}

}  // namespace minirel
