#pragma once

#include <folio/core_types.hpp>
#include <folio/result.hpp>
#include <folio/util/logger.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace folio {

namespace fs = std::filesystem;

/**
 * File header (64 bytes) at the start of every collection file.
 *
 * Layout (little-endian):
 *   [0-7]   magic "FOLIODB1"
 *   [8-11]  format version
 *   [12-15] reserved
 *   [16-23] page_size
 *   [24-31] page_data_budget
 *   [32-39] number_of_pages
 *   [40-43] CRC32 of bytes [0-39]
 *   [44-63] zero
 */
constexpr uint64_t FILE_HEADER_SIZE = 64;
constexpr uint32_t FILE_FORMAT_VERSION = 1;

/**
 * DiskManager - Fixed-size page extents of one collection file.
 *
 * Provides:
 * - Positional page reads (whole page or a leading prefix)
 * - Page writes that overwrite a page or append exactly one new page
 * - The page count, persisted in the file header on every append
 *
 * Pages are opaque byte extents here; encoding is CollectionFile's job.
 */
class DiskManager {
public:
    /**
     * Open or create a collection file.
     *
     * A new (or empty) file gets a header with zero pages. An existing file
     * must carry a valid header whose geometry matches options.
     *
     * @param path Path to the collection file
     * @param options Page geometry
     * @param logger Optional logger (not owned)
     * @return The opened disk manager, or error
     */
    static Result<std::unique_ptr<DiskManager>> open(const fs::path& path,
                                                     const StorageOptions& options,
                                                     Logger* logger = nullptr);

    DiskManager(const DiskManager&) = delete;
    DiskManager& operator=(const DiskManager&) = delete;

    ~DiskManager();

    /**
     * Read a whole page extent.
     *
     * @param page_number The page to read
     * @param data Buffer to read into (must be page_size() bytes)
     * @return PAGE_NUMBER_TOO_HIGH if page_number >= get_num_pages()
     */
    Result<void> read_page(PageNumber page_number, char* data) const;

    /**
     * Read the first length bytes of a page extent.
     */
    Result<void> read_page_prefix(PageNumber page_number, char* data, size_t length) const;

    /**
     * Write a whole page extent.
     *
     * page_number may name an existing page or get_num_pages(), in which
     * case the file grows by one page and the header is updated after the
     * page bytes are written.
     *
     * @param data Buffer to write from (must be page_size() bytes)
     * @return PAGE_NUMBER_TOO_HIGH if page_number > get_num_pages()
     */
    Result<void> write_page(PageNumber page_number, const char* data);

    Result<void> flush();

    PageNumber get_num_pages() const { return num_pages_; }

    const StorageOptions& options() const { return options_; }
    uint64_t page_size() const { return options_.page_size; }

    const fs::path& path() const { return path_; }

    uint64_t get_file_size() const;

private:
    DiskManager(fs::path path, StorageOptions options, Logger* logger);

    uint64_t get_file_offset(PageNumber page_number) const {
        return FILE_HEADER_SIZE + page_number * options_.page_size;
    }

    Result<void> open_file();
    Result<void> read_header();
    Result<void> write_header(PageNumber num_pages);

    fs::path path_;
    StorageOptions options_;
    Logger* logger_;
    mutable std::fstream file_;
    PageNumber num_pages_;
};

}  // namespace folio
