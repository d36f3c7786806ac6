#include "stash/storage/sniff.hpp"

#include <cstring>

namespace stash::storage {
    namespace {
        struct Signature {
            const u8* magic;
            u32 len;
            std::string_view type;
        };

        constexpr u8 kPdfMagic[] = {'%', 'P', 'D', 'F'};
        constexpr u8 kPngMagic[] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
        constexpr u8 kJpegMagic[] = {0xff, 0xd8};
        constexpr u8 kGif87Magic[] = {'G', 'I', 'F', '8', '7', 'a'};
        constexpr u8 kGif89Magic[] = {'G', 'I', 'F', '8', '9', 'a'};

        constexpr Signature kSignatures[] = {
            {kPdfMagic, sizeof(kPdfMagic), kTypePdf},
            {kPngMagic, sizeof(kPngMagic), kTypePng},
            {kJpegMagic, sizeof(kJpegMagic), kTypeJpeg},
            {kGif87Magic, sizeof(kGif87Magic), kTypeGif},
            {kGif89Magic, sizeof(kGif89Magic), kTypeGif},
        };

        [[nodiscard]] bool is_text_byte(u8 b) noexcept {
            return (b >= 32 && b <= 126) || b == '\t' || b == '\n' || b == '\r';
        }
    } // namespace

    std::string_view sniff_content_type(BufferView prefix) noexcept {
        if (!buffer_ok(prefix)) {
            return kTypeBinary;
        }
        const u32 len = prefix.len < kSniffPrefixBytes ? prefix.len : kSniffPrefixBytes;

        for (const Signature& sig : kSignatures) {
            if (len >= sig.len && std::memcmp(prefix.data, sig.magic, sig.len) == 0) {
                return sig.type;
            }
        }

        const u32 probe = len < kTextProbeBytes ? len : kTextProbeBytes;
        for (u32 i = 0; i < probe; ++i) {
            if (!is_text_byte(prefix.data[i])) {
                return kTypeBinary;
            }
        }
        return kTypeText;
    }

    bool compression_eligible(bool compression_enabled, std::string_view content_type) noexcept {
        if (!compression_enabled) {
            return false;
        }
        return content_type.substr(0, 6) != "image/";
    }

    bool content_type_allowed(std::string_view content_type,
        const std::vector<std::string>& allowed_prefixes) noexcept {
        for (const std::string& prefix : allowed_prefixes) {
            if (!prefix.empty() && content_type.substr(0, prefix.size()) == prefix) {
                return true;
            }
        }
        return false;
    }
} // namespace stash::storage
