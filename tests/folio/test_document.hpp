#pragma once

#include <folio/document.hpp>
#include <folio/util/serializer.hpp>

#include <cstdint>
#include <ostream>
#include <string>

// Document used throughout the tests. Encoded size inside a page is
// 4 (length prefix) + 8 (id) + 4 (name length) + name.size().
struct TestDocument {
    uint64_t id = 0;
    std::string name;

    bool operator==(const TestDocument& other) const {
        return id == other.id && name == other.name;
    }
    bool operator!=(const TestDocument& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const TestDocument& doc) {
    return os << "TestDocument{" << doc.id << ", \"" << doc.name << "\"}";
}

namespace folio {

template<>
struct DocumentTraits<TestDocument> {
    using IdType = uint64_t;

    static IdType id(const TestDocument& doc) { return doc.id; }

    static void serialize(const TestDocument& doc, BinaryWriter& writer) {
        writer.write_uint64(doc.id);
        writer.write_string(doc.name);
    }

    static bool deserialize(BinaryReader& reader, TestDocument* doc) {
        return reader.read_uint64(&doc->id) && reader.read_string(&doc->name);
    }
};

}  // namespace folio

constexpr uint64_t EMPTY_TEST_DOCUMENT_SIZE = 16;

inline TestDocument make_doc(uint64_t id, const std::string& name = "") {
    TestDocument doc;
    doc.id = id;
    doc.name = name;
    return doc;
}
