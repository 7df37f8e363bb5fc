#include "commands/command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/pages_command.hpp"
#include "commands/stats_command.hpp"

#include <minirel/util/logger.hpp>

#include <memory>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace minirel::cli;

    CLI::App app{"minirel-inspect - examine minirel table and index files"};
    app.require_subcommand(1);

    CommandContext ctx;
    app.add_flag("-v,--verbose", ctx.verbose, "Log progress to stderr");

    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<PagesCommand>());
    commands.push_back(std::make_unique<StatsCommand>());

    Command* selected = nullptr;
    for (auto& command : commands) {
        CLI::App* sub = app.add_subcommand(command->name(), command->description());
        command->setup(*sub);
        Command* raw = command.get();
        sub->callback([&selected, raw]() { selected = raw; });
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? MINIREL_EXIT_SUCCESS : MINIREL_EXIT_USAGE;
    }

    minirel::ConsoleLogger console;
    console.set_min_level(minirel::LogLevel::DEBUG);
    if (ctx.verbose) {
        ctx.logger = &console;
    }

    if (!selected) {
        std::cerr << app.help();
        return MINIREL_EXIT_USAGE;
    }
    return selected->execute(ctx);
}
