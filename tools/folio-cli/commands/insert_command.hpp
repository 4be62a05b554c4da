#pragma once

#include "command.hpp"

namespace folio::cli {

/**
 * Insert a new JSON document. Reads stdin when no document is given.
 */
class InsertCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "insert"; }
    std::string description() const override {
        return "Insert a JSON document with an unsigned \"id\" field";
    }

private:
    std::string json_;
    CLI::Option* document_option_ = nullptr;
};

}  // namespace folio::cli
