#include "find_command.hpp"

namespace folio::cli {

void FindCommand::setup(CLI::App& app) {
    auto* field = app.add_option("--field", field_, "Top-level field to compare")
        ->type_name("<name>");
    auto* equals = app.add_option("--equals", equals_, "JSON value the field must equal")
        ->type_name("<json>");
    field->needs(equals);
    equals->needs(field);

    app.add_flag("--count", count_only_, "Print only the number of matches");
}

int FindCommand::execute(CommandContext& ctx) {
    JsonCollection::Predicate predicate = [](const JsonDocument&) { return true; };

    if (!field_.empty()) {
        nlohmann::json expected;
        try {
            expected = nlohmann::json::parse(equals_);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "Error: Invalid --equals value: " << e.what() << "\n";
            return FOLIO_EXIT_USER_ERROR;
        }

        predicate = [this, expected](const JsonDocument& doc) {
            auto json = doc.to_json();
            auto it = json.find(field_);
            return it != json.end() && *it == expected;
        };
    }

    auto matches = ctx.collection->find_by(predicate);
    if (!matches.ok()) {
        return report_error(matches.error());
    }

    if (count_only_) {
        std::cout << matches.value().size() << "\n";
        return FOLIO_EXIT_SUCCESS;
    }

    for (const auto& doc : matches.value()) {
        print_document(doc, true);
    }
    return FOLIO_EXIT_SUCCESS;
}

}  // namespace folio::cli
