#pragma once

#include <folio/util/serializer.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>

namespace folio {

/**
 * DocumentTraits - The capability contract for a stored document type.
 *
 * The store is parameterized by T and reaches every document capability
 * through this traits class. Specialize it for each document type:
 *
 *   template<>
 *   struct DocumentTraits<User> {
 *       using IdType = uint64_t;
 *       static IdType id(const User& u) { return u.id; }
 *       static void serialize(const User& u, BinaryWriter& w);
 *       static bool deserialize(BinaryReader& r, User* out);
 *   };
 *
 * serialize() must be deterministic: the same document always produces the
 * same bytes, since the encoded size is what the page budget is charged.
 * deserialize() returns false on malformed input.
 *
 * T must be default and copy constructible (pages decode into a default
 * constructed T, lookups return copies). IdType must be
 * equality comparable and hashable with std::hash.
 */
template<typename T>
struct DocumentTraits;

template<typename T>
using DocumentId = typename DocumentTraits<T>::IdType;

// Per-document length prefix inside a page encoding
constexpr uint64_t DOCUMENT_LENGTH_PREFIX_SIZE = sizeof(uint32_t);

// Encoded document body (without length prefix)
template<typename T>
std::string encode_document(const T& doc) {
    BinaryWriter writer;
    DocumentTraits<T>::serialize(doc, writer);
    return writer.release();
}

/**
 * Bytes a document occupies inside a page: its length prefix plus body.
 * This is the amount charged against the page data budget.
 */
template<typename T>
uint64_t serialized_size(const T& doc) {
    return DOCUMENT_LENGTH_PREFIX_SIZE + encode_document(doc).size();
}

template<typename T>
struct is_document_type {
    static constexpr bool value =
        std::is_default_constructible<T>::value &&
        std::is_copy_constructible<T>::value &&
        std::is_copy_constructible<DocumentId<T>>::value;
};

}  // namespace folio
