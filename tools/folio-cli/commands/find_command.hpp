#pragma once

#include "command.hpp"

namespace folio::cli {

/**
 * Scan the collection, listing every document or those whose top-level
 * field equals a JSON value.
 */
class FindCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "find"; }
    std::string description() const override {
        return "List documents, optionally where a field equals a value";
    }

private:
    std::string field_;
    std::string equals_;
    bool count_only_ = false;
};

}  // namespace folio::cli
