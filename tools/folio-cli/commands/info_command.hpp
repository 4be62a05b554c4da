#pragma once

#include "command.hpp"

namespace folio::cli {

/**
 * Show geometry and per-page occupancy of the collection file.
 */
class InfoCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "info"; }
    std::string description() const override {
        return "Show collection statistics";
    }

private:
    bool pages_ = false;
};

}  // namespace folio::cli
