#pragma once

#include <string>

#include "cop/cli/commands.hpp"
#include "cop/cli/options.hpp"
#include "cop/core/errors.hpp"

namespace cop::cli {

    struct CliConfig {
        std::string keys_dir;
        std::string db_path;
    };

    // COP_KEYS_DIR and COP_DB_PATH win; otherwise both live under COP_HOME,
    // which defaults to $HOME/.cop and then /tmp/cop.
    [[nodiscard]] CliConfig config_from_env();

    inline constexpr u32 kMaxInvocationOptions = 16;
    inline constexpr u32 kMaxPositionals = 8;

    // A parsed command line. Option values and positionals alias argv, and the
    // option lists point into the object's own buffers, so it stays in place.
    struct Invocation {
        Invocation() = default;
        Invocation(const Invocation&) = delete;
        Invocation& operator=(const Invocation&) = delete;

        ParsedOption global_buf[kMaxInvocationOptions]{};
        ParsedOptions global{global_buf, 0, kMaxInvocationOptions};
        const char* command_name{nullptr};
        CommandInvocation command{};
        ParsedOption option_buf[kMaxInvocationOptions]{};
        ParsedOptions options{option_buf, 0, kMaxInvocationOptions};
        const char* pos[kMaxPositionals]{};
        u32 npos{0};
    };

    // Global options, then the command, then that command's own options and
    // positionals. An empty command line is Ok with command.id None.
    // Unknown commands are NotFound; anything else malformed is Invalid
    // (command_name is set once global options parsed, command.spec once it
    // matched a command).
    cop::core::Status parse_invocation(const CliArgs& args, Invocation* out) noexcept;

    // One invocation, program name excluded:
    //   [--keys-dir D] [--db P] <command> [args...]
    // Returns the process exit status (0 on success, 1 on any failure).
    // Errors go to stderr as code and domain names only.
    int run(const CliArgs& args, const CliConfig& defaults) noexcept;

} // namespace cop::cli
