#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "stash/core/errors.hpp"
#include "stash/core/types.hpp"
#include "stash/security/crypto.hpp"

namespace stash::storage {
    using u64 = stash::core::u64;

    inline constexpr u64 kMiB = 1024ull * 1024ull;
    // Fixed chunk size for streaming copy and chunked delivery
    inline constexpr u32 kChunkBytes = 64 * 1024;

    struct ObjectStoreConfig {
        std::string data_root{"./uploads"};
        std::string db_path{"./stash.db"};
        std::string db_journal_mode{"WAL"};

        u64 max_object_bytes{25 * kMiB};
        u64 max_owner_bytes{200 * kMiB};

        std::vector<std::string> allowed_extensions{".pdf", ".png", ".jpg", ".jpeg", ".txt", ".md"};
        std::vector<std::string> allowed_mime_prefixes{"image/", "text/", "application/pdf"};

        bool compression_enabled{true};
        int compression_level{6};

        // Absent key: new writes are stored unencrypted, old ones stay readable
        bool has_key{false};
        stash::security::Key256 key{};

        u64 stream_threshold{1 * kMiB};
    };

    // Overlays STASH_* environment variables onto `cfg`.
    // Malformed values are Invalid in the Config domain and leave `cfg` untouched.
    [[nodiscard]] stash::core::Status config_from_env(ObjectStoreConfig* cfg) noexcept;

    [[nodiscard]] stash::core::Status config_validate(const ObjectStoreConfig& cfg) noexcept;

    // "a, .B ,c" -> {".a", ".b", ".c"}
    [[nodiscard]] std::vector<std::string> config_parse_extensions(std::string_view text);
    [[nodiscard]] std::vector<std::string> config_parse_list(std::string_view text);

    [[nodiscard]] bool config_parse_bool(std::string_view text, bool* out) noexcept;
    [[nodiscard]] bool config_parse_u64(std::string_view text, u64* out) noexcept;

    [[nodiscard]] bool config_extension_allowed(const ObjectStoreConfig& cfg, std::string_view extension) noexcept;

} // namespace stash::storage
