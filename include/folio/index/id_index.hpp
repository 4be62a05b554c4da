#pragma once

#include <folio/core_types.hpp>
#include <folio/document.hpp>
#include <folio/result.hpp>
#include <folio/storage/collection_file.hpp>
#include <folio/util/logger.hpp>

#include <optional>
#include <string>
#include <unordered_map>

namespace folio {

/**
 * IdIndex - In-memory map from document id to the page holding it.
 *
 * Never persisted. Rebuilt by build_id_index() each time a collection is
 * opened, which costs one full pass over the file.
 */
template<typename T>
class IdIndex {
public:
    using IdType = DocumentId<T>;
    using Map = std::unordered_map<IdType, PageNumber>;

    std::optional<PageNumber> find(const IdType& id) const {
        auto it = map_.find(id);
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool contains(const IdType& id) const { return map_.count(id) > 0; }

    void insert_or_assign(const IdType& id, PageNumber page_number) {
        map_[id] = page_number;
    }

    bool erase(const IdType& id) { return map_.erase(id) > 0; }

    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }

    const Map& mapping() const { return map_; }

private:
    Map map_;
};

/**
 * Scan every page of a collection file and index each resident document.
 *
 * A document id seen on more than one page keeps the later page; this only
 * happens if the file was written outside a Collection and is logged.
 *
 * @return The index, or the first page read error
 */
template<typename T>
Result<IdIndex<T>> build_id_index(const CollectionFile<T>& file, Logger* logger = nullptr) {
    Logger& log = logger ? *logger : null_logger();
    IdIndex<T> index;

    for (PageNumber page_number = 0; page_number < file.number_of_pages(); ++page_number) {
        auto page = file.read_page(page_number);
        if (!page.ok()) {
            return page.error();
        }

        for (const auto& doc : page.value().documents()) {
            const auto id = DocumentTraits<T>::id(doc);
            auto previous = index.find(id);
            if (previous.has_value()) {
                log.warning("Document id recurs on pages " + std::to_string(*previous) +
                            " and " + std::to_string(page_number) + " of " +
                            file.path().string());
            }
            index.insert_or_assign(id, page_number);
        }
    }

    return index;
}

}  // namespace folio
