#pragma once

#include "../json_document.hpp"
#include "exit_codes.hpp"

#include <folio/collection.hpp>
#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace folio::cli {

using JsonCollection = Collection<JsonDocument>;

/**
 * Context passed to command execution.
 * Contains the opened collection and global settings.
 */
struct CommandContext {
    JsonCollection* collection = nullptr;
    bool verbose = false;
    CollectionConfig config;
};

/**
 * Base class for CLI commands.
 *
 * Each command implements:
 * - setup(): Configure CLI11 options and flags
 * - execute(): Perform the command action
 */
class Command {
public:
    virtual ~Command() = default;

    /**
     * Configure command options with CLI11.
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with collection and settings
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;

    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Default collection directory (~/.folio).
 */
inline std::filesystem::path get_default_directory() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".folio";
    }
    return ".folio";
}

inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::NOT_FOUND:
        case ErrorCode::DOCUMENT_NOT_FOUND:
            return FOLIO_EXIT_NOT_FOUND;
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::DUPLICATE_ID:
        case ErrorCode::DOCUMENT_TOO_BIG:
            return FOLIO_EXIT_USER_ERROR;
        default:
            return FOLIO_EXIT_STORAGE_ERROR;
    }
}

/**
 * Print an error to stderr and map it to an exit code.
 */
inline int report_error(const Error& error) {
    std::cerr << "Error: " << error.to_string() << "\n";
    return exit_code_for(error);
}

/**
 * Open the collection described by config.
 * Prints error to stderr on failure.
 *
 * @return Opened collection, or nullptr on error
 */
inline std::unique_ptr<JsonCollection> open_collection(const CollectionConfig& config,
                                                       int* exit_code) {
    auto result = JsonCollection::open(config);
    if (!result.ok()) {
        *exit_code = report_error(result.error());
        return nullptr;
    }
    return std::move(result.value());
}

// Pretty-printed document, one per line in compact mode
inline void print_document(const JsonDocument& doc, bool compact) {
    if (compact) {
        std::cout << doc.body << "\n";
    } else {
        std::cout << doc.to_json().dump(2) << "\n";
    }
}

}  // namespace folio::cli
