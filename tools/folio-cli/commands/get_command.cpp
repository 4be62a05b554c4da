#include "get_command.hpp"

namespace folio::cli {

void GetCommand::setup(CLI::App& app) {
    app.add_option("id", id_, "Document id")
        ->required()
        ->type_name("<id>");

    app.add_flag("-c,--compact", compact_, "Print the document on one line");
}

int GetCommand::execute(CommandContext& ctx) {
    auto found = ctx.collection->find_by_id(id_);
    if (!found.ok()) {
        return report_error(found.error());
    }

    if (!found.value().has_value()) {
        std::cerr << "Error: Document not found: " << id_ << "\n";
        return FOLIO_EXIT_NOT_FOUND;
    }

    print_document(*found.value(), compact_);
    return FOLIO_EXIT_SUCCESS;
}

}  // namespace folio::cli
