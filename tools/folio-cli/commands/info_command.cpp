#include "info_command.hpp"

namespace folio::cli {

void InfoCommand::setup(CLI::App& app) {
    app.add_flag("-p,--pages", pages_, "List document count and free space per page");
}

int InfoCommand::execute(CommandContext& ctx) {
    const auto* collection = ctx.collection;
    const auto& options = collection->options();

    std::cout << "Path:        " << collection->path().string() << "\n";
    std::cout << "Page size:   " << options.page_size << "\n";
    std::cout << "Page budget: " << options.page_data_budget << "\n";
    std::cout << "Pages:       " << collection->number_of_pages() << "\n";
    std::cout << "Documents:   " << collection->count() << "\n";

    if (!pages_) {
        return FOLIO_EXIT_SUCCESS;
    }

    std::cout << "\n";
    for (PageNumber page_number = 0; page_number < collection->number_of_pages(); ++page_number) {
        auto header = collection->page_header(page_number);
        if (!header.ok()) {
            return report_error(header.error());
        }
        std::cout << "  page " << page_number << ": "
                  << header.value().number_of_documents << " documents, "
                  << header.value().free_space_available << " bytes free\n";
    }
    return FOLIO_EXIT_SUCCESS;
}

}  // namespace folio::cli
