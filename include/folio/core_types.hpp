#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace folio {

namespace fs = std::filesystem;

class Logger;

// Page number - dense, 0-based, position of the page in the collection file
using PageNumber = uint64_t;

// Default page geometry
constexpr uint64_t DEFAULT_PAGE_SIZE = 64000;
constexpr uint64_t DEFAULT_PAGE_DATA_BUDGET = 62000;

// Collection file naming
constexpr const char* COLLECTION_FILE_EXTENSION = ".collection";

/**
 * Page geometry of one collection.
 *
 * page_size is the size of a page extent on disk. page_data_budget is the
 * number of document bytes a page may hold; the difference must cover the
 * page frame and page header (see page_overhead()).
 */
struct StorageOptions {
    uint64_t page_size = DEFAULT_PAGE_SIZE;
    uint64_t page_data_budget = DEFAULT_PAGE_DATA_BUDGET;

    bool operator==(const StorageOptions& other) const {
        return page_size == other.page_size &&
               page_data_budget == other.page_data_budget;
    }
    bool operator!=(const StorageOptions& other) const { return !(*this == other); }
};

/**
 * Configuration for opening a Collection.
 */
struct CollectionConfig {
    fs::path directory;
    std::string name;
    StorageOptions storage;
    Logger* logger = nullptr;  // not owned, NullLogger when unset
};

// <directory>/<name>.collection
inline fs::path collection_file_path(const fs::path& directory, const std::string& name) {
    return directory / (name + COLLECTION_FILE_EXTENSION);
}

}  // namespace folio
