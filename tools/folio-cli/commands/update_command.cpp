#include "update_command.hpp"

namespace folio::cli {

void UpdateCommand::setup(CLI::App& app) {
    app.add_option("document", json_, "New version of the JSON object")
        ->required()
        ->type_name("<json>");
}

int UpdateCommand::execute(CommandContext& ctx) {
    auto doc = parse_json_document(json_);
    if (!doc.ok()) {
        return report_error(doc.error());
    }

    const uint64_t id = doc.value().id;
    auto before = ctx.collection->page_of(id);

    auto result = ctx.collection->update_one(std::move(doc.value()));
    if (!result.ok()) {
        return report_error(result.error());
    }

    auto after = ctx.collection->page_of(id);
    if (before && after && *before != *after) {
        std::cout << "Updated document " << id << " (moved from page " << *before
                  << " to page " << *after << ")\n";
    } else {
        std::cout << "Updated document " << id << "\n";
    }
    return FOLIO_EXIT_SUCCESS;
}

}  // namespace folio::cli
