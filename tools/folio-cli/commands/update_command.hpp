#pragma once

#include "command.hpp"

namespace folio::cli {

/**
 * Replace a stored document with a new version carrying the same id.
 */
class UpdateCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "update"; }
    std::string description() const override {
        return "Replace the stored document with the same id";
    }

private:
    std::string json_;
};

}  // namespace folio::cli
