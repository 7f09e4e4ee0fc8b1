#pragma once

#include <type_traits>

#include "cop/cli/options.hpp"
#include "cop/core/errors.hpp"

namespace cop::cli {
    using u32 = cop::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Keygen = 2,
        Protect = 3,
        Countersign = 4,
        Check = 5,
        Unprotect = 6,
        Share = 7,
        Disclosures = 8,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        // Exact number of positional arguments the command takes.
        u32 positionals{0};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        const CommandSpec* spec{nullptr};
        CliArgs args{};
    };

    // Matches argv[0] against the table; args of the result is the remainder.
    cop::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // Splits command arguments into positionals and options, which may be
    // interleaved. Everything after "--" is positional. More than
    // positional_cap positionals is Invalid.
    cop::core::Status collect_arguments(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* options,
        const char** positionals,
        u32 positional_cap,
        u32* positional_count) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace cop::cli
