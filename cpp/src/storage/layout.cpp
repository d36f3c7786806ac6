#include "stash/storage/layout.hpp"

#include <cctype>
#include <cstddef>
#include <utility>

#include "stash/security/crypto.hpp"

namespace stash::storage {
    const char* format_name(OnDiskFormat f) noexcept {
        switch (f) {
            case OnDiskFormat::Plain:
                return "plain";
            case OnDiskFormat::Compressed:
                return "compressed";
            case OnDiskFormat::Encrypted:
                return "encrypted";
            case OnDiskFormat::EncryptedCompressed:
                return "encrypted+compressed";
            case OnDiskFormat::LegacyUnknown:
                return "legacy";
        }
        return "legacy";
    }

    std::string layout_extension(std::string_view logical_name) {
        const size_t slash = logical_name.find_last_of("/\\");
        if (slash != std::string_view::npos) {
            logical_name.remove_prefix(slash + 1);
        }
        const size_t dot = logical_name.rfind('.');
        // ".bashrc" has no extension
        if (dot == std::string_view::npos || dot == 0) {
            return std::string{};
        }
        std::string ext;
        ext.reserve(logical_name.size() - dot);
        for (size_t i = dot; i < logical_name.size(); ++i) {
            ext.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(logical_name[i]))));
        }
        return ext;
    }

    stash::core::Status layout_storage_name(std::string_view extension, std::string* out) noexcept {
        if (out == nullptr) {
            return stash::core::make_status(stash::core::StatusDomain::Storage, stash::core::StatusCode::Invalid);
        }

        u8 token[kStorageTokenBytes]{};
        const stash::core::Status s = stash::security::random_bytes(stash::security::BufferMut{token, sizeof(token)});
        if (!stash::core::is_ok(s)) {
            return s;
        }

        static const char hex[] = "0123456789abcdef";
        std::string name;
        name.reserve(sizeof(token) * 2 + extension.size());
        for (u8 b : token) {
            name.push_back(hex[(b >> 4) & 0xF]);
            name.push_back(hex[b & 0xF]);
        }
        name.append(extension);

        if (!layout_storage_name_valid(name)) {
            return stash::core::make_status(stash::core::StatusDomain::Storage, stash::core::StatusCode::Invalid);
        }
        *out = std::move(name);
        return stash::core::ok_status();
    }

    bool layout_storage_name_valid(std::string_view name) noexcept {
        if (name.empty() || name.size() > 255 || name.front() == '.') {
            return false;
        }
        for (char c : name) {
            const bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || c == '.' || c == '_' || c == '-';
            if (!ok) {
                return false;
            }
        }
        return true;
    }

    std::string layout_object_path(const std::string& data_root, std::string_view storage_name) {
        std::string path = data_root;
        if (!path.empty() && path.back() != '/') {
            path.push_back('/');
        }
        path.append(storage_name);
        return path;
    }
} // namespace stash::storage
