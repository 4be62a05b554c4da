#pragma once

#include <folio/core_types.hpp>
#include <folio/document.hpp>
#include <folio/result.hpp>
#include <folio/util/serializer.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace folio {

/**
 * Page header (24 bytes encoded).
 *
 * Layout (little-endian):
 *   [0-7]   page_number
 *   [8-15]  number_of_documents
 *   [16-23] free_space_available
 */
struct CollectionPageHeader {
    PageNumber page_number = 0;
    uint64_t number_of_documents = 0;
    uint64_t free_space_available = 0;

    uint64_t space_available() const { return free_space_available; }

    bool operator==(const CollectionPageHeader& other) const {
        return page_number == other.page_number &&
               number_of_documents == other.number_of_documents &&
               free_space_available == other.free_space_available;
    }
    bool operator!=(const CollectionPageHeader& other) const { return !(*this == other); }
};

constexpr uint64_t PAGE_HEADER_SIZE = 24;

/**
 * Page frame (8 bytes) wrapped around every page payload on disk:
 *   [0-3] payload_length
 *   [4-7] payload_crc32
 *   [8..] payload, zero padded to the page size
 */
constexpr uint64_t PAGE_FRAME_SIZE = 8;

// Bytes of a page extent that are never available to documents
constexpr uint64_t page_overhead() { return PAGE_FRAME_SIZE + PAGE_HEADER_SIZE; }

/**
 * Check that a page geometry can hold a full page budget.
 * Fails with INVALID_ARGUMENT otherwise.
 */
Result<void> validate_storage_options(const StorageOptions& options);

void encode_page_header(const CollectionPageHeader& header, BinaryWriter& writer);
bool decode_page_header(BinaryReader& reader, CollectionPageHeader* header);

/**
 * Wrap a page payload in its frame and zero pad it to page_size.
 * Fails with INVALID_ARGUMENT if the framed payload would not fit.
 */
Result<std::string> frame_page_payload(const std::string& payload, uint64_t page_size);

/**
 * Extract and checksum-verify the payload of a page extent.
 */
Result<std::string> unframe_page_payload(const char* data, size_t size);

/**
 * Decode only the page header from the leading bytes of a page extent.
 * The payload checksum is not verified (the payload is not read).
 */
Result<CollectionPageHeader> decode_page_header_prefix(const char* data, size_t size,
                                                       uint64_t page_size);

/**
 * CollectionPage - The documents resident in one page plus its
 * space-accounting header.
 *
 * Documents are kept in insertion order. Every mutation keeps
 *   free_space_available == data_budget - sum(serialized_size(doc))
 *   number_of_documents  == documents().size()
 */
template<typename T>
class CollectionPage {
public:
    using Traits = DocumentTraits<T>;
    using IdType = DocumentId<T>;

    CollectionPage(PageNumber page_number, uint64_t data_budget)
        : data_budget_(data_budget)
    {
        header_.page_number = page_number;
        header_.number_of_documents = 0;
        header_.free_space_available = data_budget;
    }

    PageNumber get_page_number() const { return header_.page_number; }
    const CollectionPageHeader& header() const { return header_; }
    uint64_t data_budget() const { return data_budget_; }
    const std::vector<T>& documents() const { return documents_; }

    uint64_t used_space() const { return data_budget_ - header_.free_space_available; }

    /**
     * Append a document.
     *
     * @return NO_FREE_SPACE if its serialized size exceeds the free space
     */
    Result<void> insert_document(T doc) {
        const uint64_t size = serialized_size(doc);
        return insert_document(std::move(doc), size);
    }

    // As above, with size already computed by the caller.
    // size must equal serialized_size(doc).
    Result<void> insert_document(T doc, uint64_t size) {
        if (size > header_.free_space_available) {
            return Error(ErrorCode::NO_FREE_SPACE,
                         "page " + std::to_string(header_.page_number) + " has " +
                         std::to_string(header_.free_space_available) +
                         " bytes free, document needs " + std::to_string(size));
        }

        documents_.push_back(std::move(doc));
        header_.free_space_available -= size;
        header_.number_of_documents += 1;
        return Ok();
    }

    // Copy of the first document with this id
    std::optional<T> find_document(const IdType& id) const {
        for (const auto& doc : documents_) {
            if (Traits::id(doc) == id) {
                return doc;
            }
        }
        return std::nullopt;
    }

    /**
     * Replace the document with the same id as new_doc.
     *
     * @return DOCUMENT_NOT_FOUND if no such document is resident,
     *         NO_FREE_SPACE if the size growth exceeds the free space
     *         (the page is left unchanged)
     */
    Result<void> update_document(T new_doc) {
        const IdType id = Traits::id(new_doc);
        auto it = find_position(id);
        if (it == documents_.end()) {
            return Error(ErrorCode::DOCUMENT_NOT_FOUND,
                         "document not resident on page " + std::to_string(header_.page_number));
        }

        uint64_t old_size = serialized_size(*it);
        uint64_t new_size = serialized_size(new_doc);

        if (new_size > old_size && new_size - old_size > header_.free_space_available) {
            return Error(ErrorCode::NO_FREE_SPACE,
                         "update grows document by " + std::to_string(new_size - old_size) +
                         " bytes, page " + std::to_string(header_.page_number) + " has " +
                         std::to_string(header_.free_space_available) + " free");
        }

        header_.free_space_available = header_.free_space_available + old_size - new_size;
        *it = std::move(new_doc);
        return Ok();
    }

    /**
     * Remove and return the document with this id. The last document takes
     * its slot, so in-page order is not preserved.
     */
    Result<T> remove_document(const IdType& id) {
        auto it = find_position(id);
        if (it == documents_.end()) {
            return Error(ErrorCode::DOCUMENT_NOT_FOUND,
                         "document not resident on page " + std::to_string(header_.page_number));
        }

        uint64_t size = serialized_size(*it);
        T removed = std::move(*it);
        if (it != documents_.end() - 1) {
            *it = std::move(documents_.back());
        }
        documents_.pop_back();

        header_.number_of_documents -= 1;
        header_.free_space_available += size;
        return removed;
    }

    // Page payload: header followed by length-prefixed documents
    std::string encode() const {
        BinaryWriter writer;
        writer.reserve(PAGE_HEADER_SIZE + used_space());
        encode_page_header(header_, writer);
        for (const auto& doc : documents_) {
            writer.write_string(encode_document(doc));
        }
        return writer.release();
    }

    /**
     * Decode a page payload produced by encode().
     *
     * @return CORRUPTION on truncated input, trailing bytes, undecodable
     *         documents, or a header that disagrees with the documents
     */
    static Result<CollectionPage> decode(const std::string& payload, uint64_t data_budget) {
        BinaryReader reader(payload);
        CollectionPageHeader header;
        if (!decode_page_header(reader, &header)) {
            return Error(ErrorCode::CORRUPTION, "truncated page header");
        }

        CollectionPage page(header.page_number, data_budget);
        // Each document needs at least its length prefix
        if (header.number_of_documents > reader.remaining() / DOCUMENT_LENGTH_PREFIX_SIZE) {
            return Error(ErrorCode::CORRUPTION,
                         "page " + std::to_string(header.page_number) +
                         " claims more documents than it holds");
        }
        page.documents_.reserve(static_cast<size_t>(header.number_of_documents));

        uint64_t used = 0;
        for (uint64_t i = 0; i < header.number_of_documents; ++i) {
            std::string body;
            if (!reader.read_string(&body)) {
                return Error(ErrorCode::CORRUPTION, "truncated document " + std::to_string(i));
            }

            T doc{};
            BinaryReader doc_reader(body);
            if (!Traits::deserialize(doc_reader, &doc) || doc_reader.remaining() != 0) {
                return Error(ErrorCode::CORRUPTION,
                             "undecodable document " + std::to_string(i) +
                             " on page " + std::to_string(header.page_number));
            }

            used += DOCUMENT_LENGTH_PREFIX_SIZE + body.size();
            page.documents_.push_back(std::move(doc));
        }

        if (reader.remaining() != 0) {
            return Error(ErrorCode::CORRUPTION, "trailing bytes after page documents");
        }

        if (used > data_budget || header.free_space_available != data_budget - used) {
            return Error(ErrorCode::CORRUPTION,
                         "free space of page " + std::to_string(header.page_number) +
                         " does not match its documents");
        }

        page.header_ = header;
        return page;
    }

    bool operator==(const CollectionPage& other) const {
        return header_ == other.header_ &&
               data_budget_ == other.data_budget_ &&
               documents_ == other.documents_;
    }
    bool operator!=(const CollectionPage& other) const { return !(*this == other); }

private:
    typename std::vector<T>::iterator find_position(const IdType& id) {
        return std::find_if(documents_.begin(), documents_.end(),
                            [&id](const T& doc) { return Traits::id(doc) == id; });
    }

    CollectionPageHeader header_;
    uint64_t data_budget_;
    std::vector<T> documents_;
};

}  // namespace folio
