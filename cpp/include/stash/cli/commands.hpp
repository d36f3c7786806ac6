#pragma once

#include <type_traits>

#include "stash/cli/options.hpp"
#include "stash/core/errors.hpp"

namespace stash::cli {
    using u32 = stash::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Put = 2,
        Get = 3,
        Remove = 4,
        List = 5,
        Usage = 6,
        Verify = 7,
        Rename = 8,
        GroupCreate = 9,
        GroupRemove = 10,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        // Exact number of positional arguments after the command name
        u32 positional{0};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    stash::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // The command table of the stash front end
    [[nodiscard]] const CommandSpec* default_commands(u32* count) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace stash::cli
