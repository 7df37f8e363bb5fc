#include "stats_command.hpp"

#include <minirel/types.hpp>
#include <minirel/storage/buffer_pool.hpp>
#include <minirel/storage/pager.hpp>

#include <nlohmann/json.hpp>

namespace minirel::cli {

void StatsCommand::setup(CLI::App& app) {
    app.add_option("file", file_, "Page file (.tbl or .idx)")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("--page-size", page_size_, "Page size the file was written with")
        ->check(CLI::Range(MIN_PAGE_SIZE, MAX_PAGE_SIZE));

    app.add_option("--pool", pool_size_, "Buffer pool frames")
        ->check(CLI::PositiveNumber);

    app.add_option("--policy", policy_, "Eviction policy")
        ->check(CLI::IsMember({"LRU", "CLOCK"}, CLI::ignore_case));

    app.add_option("--passes", passes_, "Number of sequential scans")
        ->check(CLI::PositiveNumber);
}

int StatsCommand::execute(CommandContext& ctx) {
    auto policy = parse_eviction_policy(policy_);
    if (!policy) {
        std::cerr << "Error: unknown policy " << policy_ << "\n";
        return MINIREL_EXIT_USAGE;
    }

    auto opened = Pager::open(file_, page_size_);
    if (!opened.ok()) {
        std::cerr << "Error: " << opened.error().to_string() << "\n";
        return MINIREL_EXIT_STORAGE_ERROR;
    }
    auto pager = std::move(opened).value();

    PageId count = pager->page_count();
    BufferPool pool(pool_size_, pager.get(), *policy, false, ctx.logger);

    for (size_t pass = 0; pass < passes_; ++pass) {
        for (PageId id = 0; id < count; ++id) {
            auto page = pool.fetch_page(id);
            if (!page.ok()) {
                std::cerr << "Error: " << page.error().to_string() << "\n";
                return MINIREL_EXIT_STORAGE_ERROR;
            }
            pool.unpin_page(id, false);
        }
        ctx.logger->debug("Pass " + std::to_string(pass + 1) + " done");
    }

    nlohmann::json report = {
        {"file", file_},
        {"pages", count},
        {"page_size", page_size_},
        {"pool_size", pool_size_},
        {"policy", eviction_policy_name(*policy)},
        {"passes", passes_},
        {"stats", pool.stats().to_json()}
    };
    std::cout << report.dump(2) << "\n";

    return MINIREL_EXIT_SUCCESS;
}

}  // namespace minirel::cli
