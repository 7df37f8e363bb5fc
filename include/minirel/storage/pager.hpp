#pragma once

#include <minirel/core_types.hpp>
#include <minirel/result.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>

namespace minirel {

namespace fs = std::filesystem;

/**
 * Pager - Fixed-size page I/O over one physical file.
 *
 * Provides:
 * - page_id <-> byte range translation (page_id = offset / page_size)
 * - Page allocation by extending the file with a zeroed page
 * - No caching; every call performs synchronous file I/O
 *
 * There is no header page and no free list: the page count is always
 * file_size / page_size, and space is only reclaimed by deleting the file.
 */
class Pager {
public:
    /**
     * Open or create a page file.
     *
     * @param path Path to the file (parent directories are created)
     * @param page_size Page size in bytes
     * @return The pager, or PAGE_FORMAT_ERROR if the existing file size is
     *         not a multiple of page_size, IO_ERROR if it cannot be opened
     */
    static Result<std::unique_ptr<Pager>> open(const fs::path& path, size_t page_size);

    ~Pager();

    // Prevent copying
    Pager(const Pager&) = delete;
    Pager& operator=(const Pager&) = delete;

    /**
     * Read a page into the provided buffer.
     *
     * @param page_id The page to read
     * @param data Buffer of at least page_size bytes
     * @return OUT_OF_RANGE if the page lies beyond the end of the file
     */
    Result<void> read_page(PageId page_id, char* data);

    /**
     * Write a full page.
     *
     * @param page_id An already allocated page
     * @param data Page bytes
     * @param size Must equal page_size
     * @return OUT_OF_RANGE for an unallocated page, INVALID_ARGUMENT for a
     *         short or long buffer
     */
    Result<void> write_page(PageId page_id, const char* data, size_t size);

    /**
     * Extend the file by one zero-initialized page.
     *
     * @return The new page's ID, or ALLOCATION_ERROR (page count unchanged)
     */
    Result<PageId> allocate_page();

    /**
     * Number of pages in the file (file_size / page_size).
     */
    PageId page_count() const;

    size_t page_size() const { return page_size_; }

    const fs::path& path() const { return path_; }

    bool is_open() const { return is_open_; }

    /**
     * Flush pending writes to the operating system.
     */
    Result<void> flush();

    /**
     * Flush and close the file. Further calls fail with IO_ERROR.
     */
    Result<void> close();

private:
    Pager(const fs::path& path, size_t page_size);

    uint64_t get_file_offset(PageId page_id) const {
        return static_cast<uint64_t>(page_id) * page_size_;
    }

    Result<void> open_file();

    fs::path path_;
    size_t page_size_;
    std::fstream file_;
    PageId num_pages_;
    bool is_open_;
    mutable std::mutex mutex_;
};

}  // namespace minirel
