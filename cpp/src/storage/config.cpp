#include "stash/storage/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <new>
#include <utility>

namespace stash::storage {

using namespace stash::core;

namespace {
    [[nodiscard]] const char* env_value(const char* name) noexcept {
        const char* v = std::getenv(name);
        if (!v || v[0] == '\0') {
            return nullptr;
        }
        return v;
    }

    [[nodiscard]] std::string_view trim(std::string_view s) noexcept {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.remove_prefix(1);
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.remove_suffix(1);
        }
        return s;
    }

    [[nodiscard]] std::string lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    [[nodiscard]] Status config_error() noexcept {
        return make_status(StatusDomain::Config, StatusCode::Invalid);
    }
}

std::vector<std::string> config_parse_list(std::string_view text) {
    std::vector<std::string> out;
    while (!text.empty()) {
        const size_t comma = text.find(',');
        const std::string_view item = trim(text.substr(0, comma));
        if (!item.empty()) {
            out.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return out;
}

std::vector<std::string> config_parse_extensions(std::string_view text) {
    std::vector<std::string> out;
    for (const std::string& item : config_parse_list(text)) {
        std::string ext = lower(item);
        if (ext.front() != '.') {
            ext.insert(ext.begin(), '.');
        }
        out.push_back(std::move(ext));
    }
    return out;
}

bool config_parse_bool(std::string_view text, bool* out) noexcept {
    if (!out) {
        return false;
    }
    text = trim(text);
    std::string v;
    try {
        v = lower(text);
    } catch (const std::bad_alloc&) {
        return false;
    }
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        *out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        *out = false;
        return true;
    }
    return false;
}

bool config_parse_u64(std::string_view text, u64* out) noexcept {
    if (!out) {
        return false;
    }
    text = trim(text);
    if (text.empty()) {
        return false;
    }
    u64 v = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return false;
    }
    *out = v;
    return true;
}

bool config_extension_allowed(const ObjectStoreConfig& cfg, std::string_view extension) noexcept {
    if (extension.empty()) {
        return false;
    }
    return std::find(cfg.allowed_extensions.begin(), cfg.allowed_extensions.end(), extension)
        != cfg.allowed_extensions.end();
}

Status config_validate(const ObjectStoreConfig& cfg) noexcept {
    if (cfg.data_root.empty() || cfg.db_path.empty()) {
        return config_error();
    }
    if (cfg.max_object_bytes == 0 || cfg.max_object_bytes > 0xFFFFFFFFull - 64) {
        return config_error();
    }
    if (cfg.compression_level < 1 || cfg.compression_level > 9) {
        return config_error();
    }
    if (cfg.allowed_extensions.empty() || cfg.allowed_mime_prefixes.empty()) {
        return config_error();
    }
    return ok_status();
}

Status config_from_env(ObjectStoreConfig* cfg) noexcept {
    if (!cfg) {
        return config_error();
    }

    try {
        ObjectStoreConfig next = *cfg;

        if (const char* v = env_value("STASH_DATA_ROOT")) {
            next.data_root = v;
        }
        if (const char* v = env_value("STASH_DB_PATH")) {
            next.db_path = v;
        }
        if (const char* v = env_value("STASH_DB_JOURNAL_MODE")) {
            next.db_journal_mode = v;
        }
        if (const char* v = env_value("STASH_MAX_UPLOAD_SIZE")) {
            if (!config_parse_u64(v, &next.max_object_bytes)) {
                return config_error();
            }
        }
        if (const char* v = env_value("STASH_MAX_USER_STORAGE")) {
            if (!config_parse_u64(v, &next.max_owner_bytes)) {
                return config_error();
            }
        }
        if (const char* v = env_value("STASH_ALLOWED_EXTENSIONS")) {
            next.allowed_extensions = config_parse_extensions(v);
        }
        if (const char* v = env_value("STASH_ALLOWED_MIME_PREFIXES")) {
            next.allowed_mime_prefixes = config_parse_list(v);
        }
        if (const char* v = env_value("STASH_FILE_COMPRESSION")) {
            if (!config_parse_bool(v, &next.compression_enabled)) {
                return config_error();
            }
        }
        if (const char* v = env_value("STASH_COMPRESSION_LEVEL")) {
            u64 level = 0;
            if (!config_parse_u64(v, &level) || level < 1 || level > 9) {
                return config_error();
            }
            next.compression_level = static_cast<int>(level);
        }
        if (const char* v = env_value("STASH_FILE_ENCRYPTION_KEY")) {
            if (!stash::security::key_from_hex(trim(v), &next.key)) {
                return config_error();
            }
            next.has_key = true;
        }
        if (const char* v = env_value("STASH_STREAM_THRESHOLD")) {
            if (!config_parse_u64(v, &next.stream_threshold)) {
                return config_error();
            }
        }

        const Status s = config_validate(next);
        if (!is_ok(s)) {
            return s;
        }
        *cfg = std::move(next);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Config, StatusCode::Unknown);
    }
    return ok_status();
}

} // namespace stash::storage
