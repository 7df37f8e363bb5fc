#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <minirel/core_types.hpp>

namespace minirel::cli {

/**
 * Print the kind and slot/entry counts of every page of a file.
 */
class PagesCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "pages"; }
    std::string description() const override {
        return "List the pages of a table or index file";
    }

private:
    std::string file_;
    size_t page_size_ = DEFAULT_PAGE_SIZE;
};

}  // namespace minirel::cli
