#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

#include <minirel/core_types.hpp>

namespace minirel::cli {

/**
 * Read every page of a file through a buffer pool and print the counters
 * as JSON.
 */
class StatsCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "stats"; }
    std::string description() const override {
        return "Scan a file through a buffer pool and report hit/miss statistics";
    }

private:
    std::string file_;
    size_t page_size_ = DEFAULT_PAGE_SIZE;
    size_t pool_size_ = DEFAULT_POOL_CAPACITY;
    std::string policy_ = "LRU";
    size_t passes_ = 1;
};

}  // namespace minirel::cli
