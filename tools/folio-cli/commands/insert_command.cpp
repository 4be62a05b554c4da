#include "insert_command.hpp"

#include <sstream>

namespace folio::cli {

void InsertCommand::setup(CLI::App& app) {
    document_option_ = app.add_option("document", json_, "JSON object, read from stdin if omitted")
        ->type_name("<json>");
}

int InsertCommand::execute(CommandContext& ctx) {
    if (document_option_->count() == 0) {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        json_ = ss.str();
    }

    auto doc = parse_json_document(json_);
    if (!doc.ok()) {
        return report_error(doc.error());
    }

    const uint64_t id = doc.value().id;
    auto result = ctx.collection->insert_one(std::move(doc.value()));
    if (!result.ok()) {
        return report_error(result.error());
    }

    if (ctx.verbose) {
        std::cerr << "Stored on page " << *ctx.collection->page_of(id) << "\n";
    }
    std::cout << "Inserted document " << id << "\n";
    return FOLIO_EXIT_SUCCESS;
}

}  // namespace folio::cli
