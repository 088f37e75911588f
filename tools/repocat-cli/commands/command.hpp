#pragma once

#include <repocat/repocat.hpp>
#include <repocat/util/logger.hpp>
#include "exit_codes.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace repocat::cli {

/**
 * Context passed to command execution.
 */
struct CommandContext {
    Logger* logger = nullptr;
    bool verbose = false;
};

/**
 * Base class for CLI commands.
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
     * Called during CLI initialization.
     *
     * @param app The CLI11 subcommand to configure
     */
    virtual void setup(CLI::App& app) = 0;

    /**
     * Execute the command.
     * Called after argument parsing succeeds.
     *
     * @param ctx Execution context with logger and settings
     * @return Exit code (0 = success)
     */
    virtual int execute(CommandContext& ctx) = 0;

    virtual std::string name() const = 0;

    virtual std::string description() const = 0;
};

// Helper functions used by multiple commands

/**
 * Config file named by $REPOCAT_CONFIG, or empty if unset.
 */
inline std::filesystem::path get_env_config_path() {
    const char* path = std::getenv(CONFIG_ENV_VAR);
    if (path && path[0] != '\0') {
        return path;
    }
    return {};
}

/**
 * Map a library error to a process exit code.
 */
inline int exit_code_for(const Error& error) {
    switch (error.code()) {
        case ErrorCode::NOT_FOUND:
            return REPOCAT_EXIT_NOT_FOUND;
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::CONFIG_ERROR:
            return REPOCAT_EXIT_USER_ERROR;
        case ErrorCode::IO_ERROR:
        case ErrorCode::PERMISSION_DENIED:
        case ErrorCode::REPORT_FAILED:
            return REPOCAT_EXIT_IO_ERROR;
        default:
            return REPOCAT_EXIT_INTERNAL;
    }
}

/**
 * Absolute, lexically normal form of a path without touching the disk.
 */
inline std::filesystem::path absolute_path(const std::filesystem::path& path) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(path, ec);
    return (ec ? path : abs).lexically_normal();
}

}  // namespace repocat::cli
