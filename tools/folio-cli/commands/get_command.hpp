#pragma once

#include "command.hpp"

namespace folio::cli {

/**
 * Retrieve and display a document by id.
 */
class GetCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "get"; }
    std::string description() const override {
        return "Get a document by id";
    }

private:
    uint64_t id_ = 0;
    bool compact_ = false;
};

}  // namespace folio::cli
