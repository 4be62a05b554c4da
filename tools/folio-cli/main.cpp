#include "commands/command.hpp"
#include "commands/find_command.hpp"
#include "commands/get_command.hpp"
#include "commands/info_command.hpp"
#include "commands/insert_command.hpp"
#include "commands/update_command.hpp"

#include <folio/util/logger.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace folio;
using namespace folio::cli;

int main(int argc, char** argv) {
    CLI::App app{"folio - embedded page-organized document store"};
    app.require_subcommand(1);

    CommandContext ctx;
    std::string directory = get_default_directory().string();
    ctx.config.name = "documents";

    app.add_option("-d,--dir", directory, "Directory holding collection files")
        ->capture_default_str();
    app.add_option("-n,--name", ctx.config.name, "Collection name")
        ->capture_default_str();
    app.add_option("--page-size", ctx.config.storage.page_size, "Page size in bytes")
        ->capture_default_str();
    app.add_option("--budget", ctx.config.storage.page_data_budget,
                   "Bytes of document data per page")
        ->capture_default_str();
    app.add_flag("-v,--verbose", ctx.verbose, "Log storage activity to stderr");

    std::vector<std::pair<CLI::App*, std::unique_ptr<Command>>> commands;
    auto add = [&](std::unique_ptr<Command> command) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        commands.emplace_back(sub, std::move(command));
    };
    add(std::make_unique<InsertCommand>());
    add(std::make_unique<GetCommand>());
    add(std::make_unique<FindCommand>());
    add(std::make_unique<UpdateCommand>());
    add(std::make_unique<InfoCommand>());

    CLI11_PARSE(app, argc, argv);

    ctx.config.directory = directory;

    ConsoleLogger logger;
    logger.set_min_level(ctx.verbose ? LogLevel::DEBUG : LogLevel::WARNING);
    ctx.config.logger = &logger;

    int exit_code = FOLIO_EXIT_SUCCESS;
    auto collection = open_collection(ctx.config, &exit_code);
    if (!collection) {
        return exit_code;
    }
    ctx.collection = collection.get();

    for (auto& [sub, command] : commands) {
        if (sub->parsed()) {
            exit_code = command->execute(ctx);
            break;
        }
    }

    auto flushed = collection->flush();
    if (!flushed.ok() && exit_code == FOLIO_EXIT_SUCCESS) {
        return report_error(flushed.error());
    }
    return exit_code;
}
