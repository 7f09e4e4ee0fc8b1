#include "cop/cli/commands.hpp"

#include <cstring>

namespace cop::cli {
    using cop::core::Status;
    using cop::core::StatusCode;
    using cop::core::StatusDomain;

    Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cop::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return cop::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return cop::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return cop::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                out->id = s.id;
                out->spec = &s;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return cop::core::ok_status();
            }
        }
        return cop::core::make_status(StatusDomain::Cli, StatusCode::NotFound);
    }

    Status collect_arguments(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* options,
        const char** positionals,
        u32 positional_cap,
        u32* positional_count) noexcept {
        if (options == nullptr || positional_count == nullptr || (positional_cap > 0 && positionals == nullptr)) {
            return cop::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (args.argc > 0 && args.argv == nullptr) {
            return cop::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *positional_count = 0;
        options->len = 0;

        u32 i = 0;
        bool options_done = false;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr) {
                return cop::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
            }
            if (!options_done && tok[0] == '-' && tok[1] != '\0') {
                // parse_options restarts its output, so parse into the free tail.
                ParsedOptions tail{options->data + options->len, 0, options->cap - options->len};
                u32 used = 0;
                const Status s = parse_options(CliArgs{args.argv + i, args.argc - i}, specs, spec_count, &tail, &used);
                if (!cop::core::is_ok(s)) {
                    return s;
                }
                options->len += tail.len;
                if (std::strcmp(args.argv[i + used - 1], "--") == 0) {
                    options_done = true;
                }
                i += used;
                continue;
            }
            if (*positional_count >= positional_cap) {
                return cop::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
            }
            positionals[(*positional_count)++] = tok;
            ++i;
        }
        return cop::core::ok_status();
    }
} // namespace cop::cli
