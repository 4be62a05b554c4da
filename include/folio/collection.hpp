#pragma once

#include <folio/core_types.hpp>
#include <folio/document.hpp>
#include <folio/index/id_index.hpp>
#include <folio/result.hpp>
#include <folio/storage/collection_file.hpp>
#include <folio/storage/collection_page.hpp>
#include <folio/util/logger.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace folio {

/**
 * Collection - Main API of a document collection.
 *
 * Combines the collection file with an identifier index built when the
 * collection is opened. All reads and writes that must keep the index
 * consistent go through this class.
 *
 * Not thread-safe. The collection file must not be opened by another
 * handle while this one is alive.
 */
template<typename T>
class Collection {
    static_assert(is_document_type<T>::value,
                  "Collection<T> requires a DocumentTraits<T> specialization and a "
                  "default and copy constructible T");

public:
    using Traits = DocumentTraits<T>;
    using IdType = DocumentId<T>;
    using Page = CollectionPage<T>;
    using Predicate = std::function<bool(const T&)>;

    /**
     * Open or create a collection and index its documents.
     *
     * @param config Directory, name, page geometry and logger
     * @return The opened collection, or error
     */
    static Result<std::unique_ptr<Collection>> open(const CollectionConfig& config) {
        if (config.name.empty()) {
            return Error(ErrorCode::INVALID_ARGUMENT, "Collection name cannot be empty");
        }

        Logger* logger = config.logger ? config.logger : &null_logger();

        auto file = CollectionFile<T>::open(config.name, config.directory,
                                            config.storage, logger);
        if (!file.ok()) {
            return file.error();
        }

        auto index = build_id_index(*file.value(), logger);
        if (!index.ok()) {
            return index.error();
        }

        auto collection = std::unique_ptr<Collection>(
            new Collection(std::move(file.value()), std::move(index.value()), logger));

        logger->info("Opened collection '" + config.name + "': " +
                     std::to_string(collection->number_of_pages()) + " pages, " +
                     std::to_string(collection->count()) + " documents");

        return std::move(collection);
    }

    static Result<std::unique_ptr<Collection>> open(const std::string& name,
                                                    const fs::path& dir,
                                                    const StorageOptions& options = {},
                                                    Logger* logger = nullptr) {
        CollectionConfig config;
        config.directory = dir;
        config.name = name;
        config.storage = options;
        config.logger = logger;
        return open(config);
    }

    Collection(const Collection&) = delete;
    Collection& operator=(const Collection&) = delete;

    // ========================================================================
    // Write Operations
    // ========================================================================

    /**
     * Insert a new document on the first page with enough free space,
     * appending a page when none has.
     *
     * @return DOCUMENT_TOO_BIG if it can never fit a page,
     *         DUPLICATE_ID if the id is already stored
     */
    Result<void> insert_one(T doc) {
        const uint64_t size = serialized_size(doc);
        return insert_sized(std::move(doc), size);
    }

    /**
     * Replace a stored document with a new version (same id).
     *
     * The document stays on its page when the new version fits there.
     * Otherwise it is removed from that page and inserted again, which may
     * move it to another page.
     *
     * @return NOT_FOUND if the id is not stored,
     *         DOCUMENT_TOO_BIG if the new version can never fit a page
     *         (the stored version is kept)
     */
    Result<void> update_one(T doc) {
        const IdType id = Traits::id(doc);
        auto page_number = index_.find(id);
        if (!page_number.has_value()) {
            return Error(ErrorCode::NOT_FOUND, "document id not found");
        }

        auto page = file_->read_page(*page_number);
        if (!page.ok()) {
            return page.error();
        }

        auto updated = page.value().update_document(doc);
        if (updated.ok()) {
            return file_->write_page(page.value());
        }

        if (updated.error_code() != ErrorCode::NO_FREE_SPACE) {
            return updated;
        }

        // Relocate
        const uint64_t size = serialized_size(doc);
        if (size > options().page_data_budget) {
            return Error(ErrorCode::DOCUMENT_TOO_BIG,
                         "document of " + std::to_string(size) +
                         " bytes exceeds the page data budget of " +
                         std::to_string(options().page_data_budget));
        }

        auto removed = page.value().remove_document(id);
        if (!removed.ok()) {
            return removed.error();
        }

        auto written = file_->write_page(page.value());
        if (!written.ok()) {
            return written;
        }
        index_.erase(id);

        logger_->debug("Relocating document of " + std::to_string(size) +
                       " bytes off page " + std::to_string(*page_number));

        return insert_sized(std::move(doc), size);
    }

    // ========================================================================
    // Query Operations
    // ========================================================================

    /**
     * Get a copy of the document with this id.
     *
     * @return nullopt if the id is not stored; read errors propagate
     */
    Result<std::optional<T>> find_by_id(const IdType& id) const {
        auto page_number = index_.find(id);
        if (!page_number.has_value()) {
            return std::optional<T>();
        }

        auto page = file_->read_page(*page_number);
        if (!page.ok()) {
            return page.error();
        }

        return page.value().find_document(id);
    }

    /**
     * Scan every document and collect copies of those matching predicate,
     * in ascending page order and insertion order within a page.
     */
    Result<std::vector<T>> find_by(const Predicate& predicate) const {
        std::vector<T> matches;
        for (PageNumber page_number = 0; page_number < file_->number_of_pages(); ++page_number) {
            auto page = file_->read_page(page_number);
            if (!page.ok()) {
                return page.error();
            }

            for (const auto& doc : page.value().documents()) {
                if (predicate(doc)) {
                    matches.push_back(doc);
                }
            }
        }
        return matches;
    }

    bool contains(const IdType& id) const { return index_.contains(id); }

    // Page currently holding this id, according to the index
    std::optional<PageNumber> page_of(const IdType& id) const { return index_.find(id); }

    Result<CollectionPageHeader> page_header(PageNumber page_number) const {
        return file_->read_page_header(page_number);
    }

    // ========================================================================
    // Statistics
    // ========================================================================

    size_t count() const { return index_.size(); }

    PageNumber number_of_pages() const { return file_->number_of_pages(); }

    const StorageOptions& options() const { return file_->options(); }

    const fs::path& path() const { return file_->path(); }

    Result<void> flush() { return file_->flush(); }

private:
    // size must equal serialized_size(doc)
    Result<void> insert_sized(T doc, uint64_t size) {
        if (size > options().page_data_budget) {
            return Error(ErrorCode::DOCUMENT_TOO_BIG,
                         "document of " + std::to_string(size) +
                         " bytes exceeds the page data budget of " +
                         std::to_string(options().page_data_budget));
        }

        const IdType id = Traits::id(doc);
        if (index_.contains(id)) {
            return Error(ErrorCode::DUPLICATE_ID, "document id already exists");
        }

        auto page = first_page_with_space(size);
        if (!page.ok()) {
            return page.error();
        }

        auto inserted = page.value().insert_document(std::move(doc), size);
        if (!inserted.ok()) {
            return inserted;
        }

        auto written = file_->write_page(page.value());
        if (!written.ok()) {
            return written;
        }

        index_.insert_or_assign(id, page.value().get_page_number());
        return Ok();
    }

    Collection(std::unique_ptr<CollectionFile<T>> file, IdIndex<T> index, Logger* logger)
        : file_(std::move(file))
        , index_(std::move(index))
        , logger_(logger)
    {}

    // First fit by ascending page number, or a fresh page past the end
    Result<Page> first_page_with_space(uint64_t size) const {
        const PageNumber num_pages = file_->number_of_pages();
        for (PageNumber page_number = 0; page_number < num_pages; ++page_number) {
            auto header = file_->read_page_header(page_number);
            if (!header.ok()) {
                return header.error();
            }

            if (header.value().space_available() >= size) {
                return file_->read_page(page_number);
            }
        }

        logger_->debug("No page has " + std::to_string(size) +
                       " bytes free, allocating page " + std::to_string(num_pages));
        return Page(num_pages, options().page_data_budget);
    }

    std::unique_ptr<CollectionFile<T>> file_;
    IdIndex<T> index_;
    Logger* logger_;
};

}  // namespace folio
