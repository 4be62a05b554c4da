#pragma once

#include <folio/document.hpp>
#include <folio/result.hpp>
#include <folio/util/serializer.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace folio::cli {

/**
 * A JSON object stored in a collection.
 *
 * The object must carry an unsigned integer "id" field. The whole object
 * is kept in compact form so it round-trips unchanged.
 */
struct JsonDocument {
    uint64_t id = 0;
    std::string body;

    nlohmann::json to_json() const { return nlohmann::json::parse(body); }
};

/**
 * Parse a JSON object with an unsigned integer "id" field.
 *
 * @return The document, or INVALID_ARGUMENT describing what is wrong
 */
inline Result<JsonDocument> parse_json_document(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Invalid JSON: " + std::string(e.what()));
    }

    if (!json.is_object()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "Document must be a JSON object");
    }

    auto it = json.find("id");
    if (it == json.end() || !it->is_number_unsigned()) {
        return Error(ErrorCode::INVALID_ARGUMENT,
                     "Document needs an unsigned integer \"id\" field");
    }

    JsonDocument doc;
    doc.id = it->get<uint64_t>();
    doc.body = json.dump();
    return doc;
}

}  // namespace folio::cli

namespace folio {

template<>
struct DocumentTraits<cli::JsonDocument> {
    using IdType = uint64_t;

    static IdType id(const cli::JsonDocument& doc) { return doc.id; }

    static void serialize(const cli::JsonDocument& doc, BinaryWriter& writer) {
        writer.write_uint64(doc.id);
        writer.write_string(doc.body);
    }

    static bool deserialize(BinaryReader& reader, cli::JsonDocument* doc) {
        return reader.read_uint64(&doc->id) && reader.read_string(&doc->body);
    }
};

}  // namespace folio
