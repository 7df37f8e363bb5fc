#pragma once

#include <minirel/util/logger.hpp>
#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

namespace minirel::cli {

/**
 * Context passed to command execution.
 */
struct CommandContext {
    bool verbose = false;
    Logger* logger = null_logger();
};

/**
 * Base class for inspector commands.
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
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command after argument parsing succeeded.
     *
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;

    virtual std::string description() const = 0;
};

}  // namespace minirel::cli
