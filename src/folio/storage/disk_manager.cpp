#include <folio/storage/disk_manager.hpp>
#include <folio/storage/collection_page.hpp>
#include <folio/util/crc32.hpp>
#include <folio/util/serializer.hpp>

#include <cstring>
#include <system_error>
#include <vector>

namespace folio {

namespace {

constexpr char FILE_MAGIC[8] = {'F', 'O', 'L', 'I', 'O', 'D', 'B', '1'};
constexpr size_t FILE_HEADER_CHECKSUMMED_BYTES = 40;

std::string encode_file_header(const StorageOptions& options, PageNumber num_pages) {
    BinaryWriter writer;
    writer.reserve(FILE_HEADER_SIZE);
    writer.write_raw(FILE_MAGIC, sizeof(FILE_MAGIC));
    writer.write_uint32(FILE_FORMAT_VERSION);
    writer.write_uint32(0);
    writer.write_uint64(options.page_size);
    writer.write_uint64(options.page_data_budget);
    writer.write_uint64(num_pages);
    writer.write_uint32(CRC32::compute(writer.data().data(), FILE_HEADER_CHECKSUMMED_BYTES));
    writer.pad_to(FILE_HEADER_SIZE);
    return writer.release();
}

}  // namespace

DiskManager::DiskManager(fs::path path, StorageOptions options, Logger* logger)
    : path_(std::move(path))
    , options_(options)
    , logger_(logger ? logger : &null_logger())
    , num_pages_(0)
{}

DiskManager::~DiskManager() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

Result<std::unique_ptr<DiskManager>> DiskManager::open(const fs::path& path,
                                                       const StorageOptions& options,
                                                       Logger* logger) {
    auto valid = validate_storage_options(options);
    if (!valid.ok()) {
        return valid.error();
    }

    auto manager = std::unique_ptr<DiskManager>(new DiskManager(path, options, logger));
    auto result = manager->open_file();
    if (!result.ok()) {
        return result.error();
    }
    return std::move(manager);
}

Result<void> DiskManager::open_file() {
    std::error_code ec;
    bool file_exists = fs::exists(path_, ec);
    uint64_t existing_size = file_exists ? fs::file_size(path_, ec) : 0;
    if (ec) {
        return Error(ErrorCode::IO_ERROR,
                     "Failed to stat " + path_.string() + ": " + ec.message());
    }

    if (file_exists && existing_size > 0) {
        file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
        if (!file_.is_open()) {
            return Error(ErrorCode::IO_ERROR, "Failed to open collection file " + path_.string());
        }

        if (existing_size < FILE_HEADER_SIZE) {
            return Error(ErrorCode::CORRUPTION,
                         "Collection file " + path_.string() + " is too small for its header");
        }

        auto result = read_header();
        if (!result.ok()) {
            return result;
        }

        // Detect truncation
        if (existing_size < get_file_offset(num_pages_)) {
            return Error(ErrorCode::CORRUPTION,
                         "Collection file " + path_.string() + " is truncated: header records " +
                         std::to_string(num_pages_) + " pages");
        }
        return Ok();
    }

    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error(ErrorCode::IO_ERROR,
                         "Failed to create directory " + path_.parent_path().string() +
                         ": " + ec.message());
        }
    }

    file_.open(path_, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        return Error(ErrorCode::IO_ERROR, "Failed to create collection file " + path_.string());
    }

    logger_->info("Created collection file " + path_.string());
    return write_header(0);
}

Result<void> DiskManager::read_header() {
    std::vector<char> bytes(FILE_HEADER_SIZE);
    file_.seekg(0);
    file_.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!file_.good()) {
        file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to read file header");
    }

    BinaryReader reader(bytes.data(), bytes.size());
    char magic[sizeof(FILE_MAGIC)];
    uint32_t version = 0;
    uint32_t reserved = 0;
    StorageOptions stored;
    uint64_t num_pages = 0;
    uint32_t checksum = 0;
    if (!reader.read_raw(magic, sizeof(magic)) ||
        !reader.read_uint32(&version) ||
        !reader.read_uint32(&reserved) ||
        !reader.read_uint64(&stored.page_size) ||
        !reader.read_uint64(&stored.page_data_budget) ||
        !reader.read_uint64(&num_pages) ||
        !reader.read_uint32(&checksum)) {
        return Error(ErrorCode::CORRUPTION, "Truncated file header");
    }

    if (std::memcmp(magic, FILE_MAGIC, sizeof(FILE_MAGIC)) != 0) {
        return Error(ErrorCode::CORRUPTION, path_.string() + " is not a collection file");
    }

    if (checksum != CRC32::compute(bytes.data(), FILE_HEADER_CHECKSUMMED_BYTES)) {
        return Error(ErrorCode::CORRUPTION, "File header checksum mismatch");
    }

    if (version != FILE_FORMAT_VERSION) {
        return Error(ErrorCode::CORRUPTION,
                     "Unsupported collection file version " + std::to_string(version));
    }

    if (stored != options_) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Page geometry mismatch: file has page_size=" +
                     std::to_string(stored.page_size) + " page_data_budget=" +
                     std::to_string(stored.page_data_budget) + ", requested page_size=" +
                     std::to_string(options_.page_size) + " page_data_budget=" +
                     std::to_string(options_.page_data_budget));
    }

    num_pages_ = num_pages;
    return Ok();
}

Result<void> DiskManager::write_header(PageNumber num_pages) {
    std::string header = encode_file_header(options_, num_pages);

    file_.seekp(0);
    file_.write(header.data(), static_cast<std::streamsize>(header.size()));
    file_.flush();
    if (!file_.good()) {
        file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to write file header");
    }

    return Ok();
}

Result<void> DiskManager::read_page(PageNumber page_number, char* data) const {
    return read_page_prefix(page_number, data, static_cast<size_t>(options_.page_size));
}

Result<void> DiskManager::read_page_prefix(PageNumber page_number, char* data,
                                           size_t length) const {
    if (page_number >= num_pages_) {
        return Error(ErrorCode::PAGE_NUMBER_TOO_HIGH,
                     "Page " + std::to_string(page_number) + " does not exist (" +
                     std::to_string(num_pages_) + " pages)");
    }

    if (!data || length > options_.page_size) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Invalid page read buffer");
    }

    file_.seekg(static_cast<std::streamoff>(get_file_offset(page_number)));
    file_.read(data, static_cast<std::streamsize>(length));
    if (!file_.good()) {
        file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to read page " + std::to_string(page_number));
    }

    return Ok();
}

Result<void> DiskManager::write_page(PageNumber page_number, const char* data) {
    if (page_number > num_pages_) {
        return Error(ErrorCode::PAGE_NUMBER_TOO_HIGH,
                     "Cannot write page " + std::to_string(page_number) +
                     ": file has " + std::to_string(num_pages_) + " pages");
    }

    if (!data) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Null data buffer");
    }

    file_.seekp(static_cast<std::streamoff>(get_file_offset(page_number)));
    file_.write(data, static_cast<std::streamsize>(options_.page_size));
    if (!file_.good()) {
        file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to write page " + std::to_string(page_number));
    }

    if (page_number == num_pages_) {
        auto result = write_header(num_pages_ + 1);
        if (!result.ok()) {
            return result;
        }
        ++num_pages_;
        logger_->debug("Appended page " + std::to_string(page_number) + " to " + path_.string());
    }

    return Ok();
}

Result<void> DiskManager::flush() {
    file_.flush();
    if (!file_.good()) {
        file_.clear();
        return Error(ErrorCode::IO_ERROR, "Failed to flush collection file");
    }

    return Ok();
}

uint64_t DiskManager::get_file_size() const {
    std::error_code ec;
    auto size = fs::file_size(path_, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

}  // namespace folio
