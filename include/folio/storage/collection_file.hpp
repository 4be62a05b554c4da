#pragma once

#include <folio/core_types.hpp>
#include <folio/result.hpp>
#include <folio/storage/collection_page.hpp>
#include <folio/storage/disk_manager.hpp>
#include <folio/util/logger.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace folio {

/**
 * CollectionFile - Maps page numbers of one collection to fixed-size
 * extents of its backing file and encodes/decodes whole pages.
 *
 * The file is never zero-paged once opened: an empty page 0 is written
 * when the file holds no pages.
 *
 * Writing through this class bypasses the identifier index of any
 * Collection open on the same file.
 */
template<typename T>
class CollectionFile {
public:
    using Page = CollectionPage<T>;

    /**
     * Open (creating if absent) <dir>/<name>.collection.
     *
     * @param name Collection name
     * @param dir Directory holding the collection file
     * @param options Page geometry; must match an existing file's
     * @param logger Optional logger (not owned)
     */
    static Result<std::unique_ptr<CollectionFile>> open(const std::string& name,
                                                        const fs::path& dir,
                                                        const StorageOptions& options = {},
                                                        Logger* logger = nullptr) {
        auto disk = DiskManager::open(collection_file_path(dir, name), options, logger);
        if (!disk.ok()) {
            return disk.error();
        }

        auto file = std::unique_ptr<CollectionFile>(
            new CollectionFile(std::move(disk.value())));

        if (file->number_of_pages() == 0) {
            auto result = file->write_page(Page(0, options.page_data_budget));
            if (!result.ok()) {
                return result.error();
            }
        }

        return std::move(file);
    }

    CollectionFile(const CollectionFile&) = delete;
    CollectionFile& operator=(const CollectionFile&) = delete;

    /**
     * Read and decode a whole page.
     *
     * @return PAGE_NUMBER_TOO_HIGH past the last page, CORRUPTION on
     *         malformed bytes, IO_ERROR on read failure
     */
    Result<Page> read_page(PageNumber page_number) const {
        std::vector<char> buffer(static_cast<size_t>(disk_->page_size()));
        auto read = disk_->read_page(page_number, buffer.data());
        if (!read.ok()) {
            return read.error();
        }

        auto payload = unframe_page_payload(buffer.data(), buffer.size());
        if (!payload.ok()) {
            return Error(payload.error().code(),
                         "page " + std::to_string(page_number) + ": " + payload.error().message());
        }

        auto page = Page::decode(payload.value(), disk_->options().page_data_budget);
        if (!page.ok()) {
            return page.error();
        }

        if (page.value().get_page_number() != page_number) {
            return Error(ErrorCode::CORRUPTION,
                         "extent " + std::to_string(page_number) + " holds page " +
                         std::to_string(page.value().get_page_number()));
        }

        return page;
    }

    /**
     * Read only the page header, without decoding any document.
     */
    Result<CollectionPageHeader> read_page_header(PageNumber page_number) const {
        char buffer[page_overhead()];
        auto read = disk_->read_page_prefix(page_number, buffer, sizeof(buffer));
        if (!read.ok()) {
            return read.error();
        }

        auto header = decode_page_header_prefix(buffer, sizeof(buffer), disk_->page_size());
        if (!header.ok()) {
            return header;
        }

        if (header.value().page_number != page_number) {
            return Error(ErrorCode::CORRUPTION,
                         "extent " + std::to_string(page_number) + " holds page " +
                         std::to_string(header.value().page_number));
        }

        return header;
    }

    /**
     * Encode a page and write it at its extent.
     *
     * @return PAGE_NUMBER_TOO_HIGH if the page number is more than one past
     *         the last page
     */
    Result<void> write_page(const Page& page) {
        if (page.get_page_number() > disk_->get_num_pages()) {
            return Error(ErrorCode::PAGE_NUMBER_TOO_HIGH,
                         "Cannot write page " + std::to_string(page.get_page_number()) +
                         ": file has " + std::to_string(disk_->get_num_pages()) + " pages");
        }

        auto framed = frame_page_payload(page.encode(), disk_->page_size());
        if (!framed.ok()) {
            return framed.error();
        }

        return disk_->write_page(page.get_page_number(), framed.value().data());
    }

    PageNumber number_of_pages() const { return disk_->get_num_pages(); }

    const StorageOptions& options() const { return disk_->options(); }

    const fs::path& path() const { return disk_->path(); }

    Result<void> flush() { return disk_->flush(); }

private:
    explicit CollectionFile(std::unique_ptr<DiskManager> disk)
        : disk_(std::move(disk)) {}

    std::unique_ptr<DiskManager> disk_;
};

}  // namespace folio
