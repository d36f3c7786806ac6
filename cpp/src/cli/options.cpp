#include "stash/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace stash::cli {
    namespace {
        [[nodiscard]] stash::core::Status usage_error() noexcept {
            return stash::core::make_status(stash::core::StatusDomain::Cli, stash::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs,
            u32 spec_count,
            const char* name,
            size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] stash::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return usage_error();
            }
            out->data[out->len++] = opt;
            return stash::core::ok_status();
        }

        // Fills opt.value from `value` according to the spec type
        [[nodiscard]] stash::core::Status set_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            opt->id = spec.id;
            opt->type = spec.type;
            switch (spec.type) {
                case OptionType::Flag:
                    if (value != nullptr) {
                        return usage_error();
                    }
                    opt->value.boolv = 1;
                    return stash::core::ok_status();
                case OptionType::String:
                    opt->value.str = value;
                    return stash::core::ok_status();
                case OptionType::I64: {
                    i64 v{};
                    if (!parse_i64(value, &v)) {
                        return usage_error();
                    }
                    opt->value.i64v = v;
                    return stash::core::ok_status();
                }
            }
            return usage_error();
        }
    } // namespace

    stash::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return usage_error();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return usage_error();
        }
        if (spec_count > 0 && specs == nullptr) {
            return usage_error();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const size_t name_len = eq ? static_cast<size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return usage_error();
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (spec != nullptr && tok[2] != '\0') {
                    if (spec->type == OptionType::Flag) {
                        return usage_error();
                    }
                    value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return usage_error();
            }
            ++i;

            if (spec->type != OptionType::Flag && value == nullptr) {
                if (i >= args.argc || args.argv[i] == nullptr) {
                    return usage_error();
                }
                value = args.argv[i++];
            }

            ParsedOption opt{};
            stash::core::Status s = set_value(*spec, value, &opt);
            if (!stash::core::is_ok(s)) {
                return s;
            }
            s = push_option(out, opt);
            if (!stash::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return stash::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace stash::cli
