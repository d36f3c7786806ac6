#include "stash/cli/commands.hpp"

#include <cstring>

namespace stash::cli {
    namespace {
        constexpr CommandSpec kCommands[] = {
            {CommandId::Help, "help", 0},
            {CommandId::Put, "put", 1},
            {CommandId::Get, "get", 1},
            {CommandId::Remove, "rm", 1},
            {CommandId::List, "ls", 0},
            {CommandId::Usage, "usage", 0},
            {CommandId::Verify, "verify", 1},
            {CommandId::Rename, "rename", 2},
            {CommandId::GroupCreate, "group-create", 1},
            {CommandId::GroupRemove, "group-rm", 1},
        };
    } // namespace

    const CommandSpec* default_commands(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kCommands) / sizeof(kCommands[0]));
        }
        return kCommands;
    }

    stash::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return stash::core::make_status(stash::core::StatusDomain::Cli, stash::core::StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return stash::core::make_status(stash::core::StatusDomain::Cli, stash::core::StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return stash::core::make_status(stash::core::StatusDomain::Cli, stash::core::StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return stash::core::make_status(stash::core::StatusDomain::Cli, stash::core::StatusCode::Invalid);
        }

        const CommandSpec* match = nullptr;
        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                match = &s;
                break;
            }
        }
        if (match == nullptr) {
            return stash::core::make_status(stash::core::StatusDomain::Cli, stash::core::StatusCode::NotFound);
        }

        // Positionals come first and are never option-like
        if (args.argc - 1 < match->positional) {
            return stash::core::make_status(stash::core::StatusDomain::Cli, stash::core::StatusCode::Invalid);
        }
        for (u32 i = 1; i <= match->positional; ++i) {
            if (args.argv[i] == nullptr || (args.argv[i][0] == '-' && args.argv[i][1] != '\0')) {
                return stash::core::make_status(stash::core::StatusDomain::Cli, stash::core::StatusCode::Invalid);
            }
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        return stash::core::ok_status();
    }
} // namespace stash::cli
