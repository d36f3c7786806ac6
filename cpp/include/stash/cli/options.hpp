#pragma once

#include <type_traits>

#include "stash/core/errors.hpp"
#include "stash/core/types.hpp"

namespace stash::cli {
    using u8 = stash::core::u8;
    using u32 = stash::core::u32;
    using i64 = stash::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Data = 1,
        Db = 2,
        User = 3,
        Verbose = 4,
        Visibility = 5,
        Group = 6,
        Output = 7,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parse_options never allocates
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options and stops at the first positional token or "--".
    // *consumed is the number of argv entries used.
    stash::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence wins
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace stash::cli
