#include "stash/core/models.hpp"

#include <cctype>
#include <cstddef>

namespace stash::core {
    namespace {
        [[nodiscard]] bool equals_ci(std::string_view a, std::string_view b) noexcept {
            if (a.size() != b.size()) {
                return false;
            }
            for (size_t i = 0; i < a.size(); ++i) {
                const auto ca = static_cast<unsigned char>(a[i]);
                const auto cb = static_cast<unsigned char>(b[i]);
                if (std::tolower(ca) != std::tolower(cb)) {
                    return false;
                }
            }
            return true;
        }
    } // namespace

    Visibility parse_visibility(std::string_view text) noexcept {
        if (equals_ci(text, "public")) {
            return Visibility::Public;
        }
        if (equals_ci(text, "unlisted")) {
            return Visibility::Unlisted;
        }
        return Visibility::Private;
    }

    const char* visibility_name(Visibility v) noexcept {
        switch (v) {
            case Visibility::Public:
                return "public";
            case Visibility::Unlisted:
                return "unlisted";
            case Visibility::Private:
                return "private";
        }
        return "private";
    }
} // namespace stash::core
