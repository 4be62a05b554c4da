#include <folio/storage/collection_page.hpp>
#include <folio/util/crc32.hpp>

#include <limits>

namespace folio {

Result<void> validate_storage_options(const StorageOptions& options) {
    if (options.page_data_budget == 0) {
        return Error(ErrorCode::INVALID_ARGUMENT, "page data budget must be positive");
    }

    // payload_length is a uint32 in the page frame
    if (options.page_size > std::numeric_limits<uint32_t>::max()) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "page size " + std::to_string(options.page_size) + " exceeds 4 GiB");
    }

    if (options.page_size < page_overhead() ||
        options.page_data_budget > options.page_size - page_overhead()) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "page data budget " + std::to_string(options.page_data_budget) +
                     " plus " + std::to_string(page_overhead()) +
                     " bytes of page overhead exceeds page size " +
                     std::to_string(options.page_size));
    }

    return Ok();
}

void encode_page_header(const CollectionPageHeader& header, BinaryWriter& writer) {
    writer.write_uint64(header.page_number);
    writer.write_uint64(header.number_of_documents);
    writer.write_uint64(header.free_space_available);
}

bool decode_page_header(BinaryReader& reader, CollectionPageHeader* header) {
    return reader.read_uint64(&header->page_number) &&
           reader.read_uint64(&header->number_of_documents) &&
           reader.read_uint64(&header->free_space_available);
}

Result<std::string> frame_page_payload(const std::string& payload, uint64_t page_size) {
    if (payload.size() + PAGE_FRAME_SIZE > page_size) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "page payload of " + std::to_string(payload.size()) +
                     " bytes does not fit a " + std::to_string(page_size) + " byte page");
    }

    BinaryWriter writer;
    writer.reserve(static_cast<size_t>(page_size));
    writer.write_uint32(static_cast<uint32_t>(payload.size()));
    writer.write_uint32(CRC32::compute(payload));
    writer.write_raw(payload.data(), payload.size());
    writer.pad_to(static_cast<size_t>(page_size));
    return writer.release();
}

Result<std::string> unframe_page_payload(const char* data, size_t size) {
    BinaryReader reader(data, size);
    uint32_t length = 0;
    uint32_t checksum = 0;
    if (!reader.read_uint32(&length) || !reader.read_uint32(&checksum)) {
        return Error(ErrorCode::CORRUPTION, "truncated page frame");
    }

    if (!reader.has_remaining(length)) {
        return Error(ErrorCode::CORRUPTION,
                     "page payload length " + std::to_string(length) + " exceeds page");
    }

    std::string payload(data + PAGE_FRAME_SIZE, length);
    if (CRC32::compute(payload) != checksum) {
        return Error(ErrorCode::CORRUPTION, "page checksum mismatch");
    }

    return payload;
}

Result<CollectionPageHeader> decode_page_header_prefix(const char* data, size_t size,
                                                       uint64_t page_size) {
    BinaryReader reader(data, size);
    uint32_t length = 0;
    if (!reader.read_uint32(&length) || !reader.skip(sizeof(uint32_t))) {
        return Error(ErrorCode::CORRUPTION, "truncated page frame");
    }

    if (length < PAGE_HEADER_SIZE || length + PAGE_FRAME_SIZE > page_size) {
        return Error(ErrorCode::CORRUPTION,
                     "invalid page payload length " + std::to_string(length));
    }

    CollectionPageHeader header;
    if (!decode_page_header(reader, &header)) {
        return Error(ErrorCode::CORRUPTION, "truncated page header");
    }
    return header;
}

}  // namespace folio
