#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "stash/storage/buffer.hpp"

namespace stash::storage {
    // Bytes of plaintext inspected for signatures
    inline constexpr u32 kSniffPrefixBytes = 512;
    // Shorter prefix inspected by the printable-text fallback
    inline constexpr u32 kTextProbeBytes = 128;

    inline constexpr std::string_view kTypePdf = "application/pdf";
    inline constexpr std::string_view kTypePng = "image/png";
    inline constexpr std::string_view kTypeJpeg = "image/jpeg";
    inline constexpr std::string_view kTypeGif = "image/gif";
    inline constexpr std::string_view kTypeText = "text/plain";
    inline constexpr std::string_view kTypeBinary = "application/octet-stream";

    // Best-effort classification from fixed signatures; advisory only.
    // Only the first kSniffPrefixBytes of `prefix` are considered.
    [[nodiscard]] std::string_view sniff_content_type(BufferView prefix) noexcept;

    // Already-compressed image formats are stored as-is
    [[nodiscard]] bool compression_eligible(bool compression_enabled, std::string_view content_type) noexcept;

    [[nodiscard]] bool content_type_allowed(std::string_view content_type,
        const std::vector<std::string>& allowed_prefixes) noexcept;

} // namespace stash::storage
