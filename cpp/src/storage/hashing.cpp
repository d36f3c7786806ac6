#include "stash/storage/hashing.hpp"

#include <cstddef>

#include <openssl/evp.h>

namespace stash::storage {
    using stash::core::make_status;
    using stash::core::StatusCode;
    using stash::core::StatusDomain;

    namespace {
        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    } // namespace

    Sha256::~Sha256() noexcept {
        if (ctx_ != nullptr) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    stash::core::Status Sha256::init() noexcept {
        if (ctx_ == nullptr) {
            ctx_ = EVP_MD_CTX_new();
            if (ctx_ == nullptr) {
                return make_status(StatusDomain::Storage, StatusCode::Unavailable);
            }
        }
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            return make_status(StatusDomain::Storage, StatusCode::Unknown);
        }
        return stash::core::ok_status();
    }

    stash::core::Status Sha256::update(BufferView data) noexcept {
        if (ctx_ == nullptr || !buffer_ok(data)) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (data.len == 0) {
            return stash::core::ok_status();
        }
        if (EVP_DigestUpdate(ctx_, data.data, static_cast<size_t>(data.len)) != 1) {
            return make_status(StatusDomain::Storage, StatusCode::Unknown);
        }
        return stash::core::ok_status();
    }

    stash::core::Status Sha256::finish(stash::core::Hash256* out) noexcept {
        if (ctx_ == nullptr || out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, out->b.data(), &len) != 1 || len != out->b.size()) {
            return make_status(StatusDomain::Storage, StatusCode::Unknown);
        }
        return stash::core::ok_status();
    }

    stash::core::Status hash_compute(BufferView data, stash::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (!buffer_ok(data)) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        Sha256 hasher;
        stash::core::Status s = hasher.init();
        if (!stash::core::is_ok(s)) {
            return s;
        }
        s = hasher.update(data);
        if (!stash::core::is_ok(s)) {
            return s;
        }
        return hasher.finish(out);
    }

    std::string hash_to_hex(const stash::core::Hash256& h) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(h.b.size() * 2);
        for (u8 b : h.b) {
            out.push_back(hex[(b >> 4) & 0xF]);
            out.push_back(hex[b & 0xF]);
        }
        return out;
    }

    bool hash_from_hex(std::string_view hex, stash::core::Hash256* out) noexcept {
        if (out == nullptr || hex.size() != out->b.size() * 2) {
            return false;
        }
        stash::core::Hash256 h{};
        for (size_t i = 0; i < h.b.size(); ++i) {
            const int hi = hex_value(hex[2 * i]);
            const int lo = hex_value(hex[2 * i + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            h.b[i] = static_cast<u8>((hi << 4) | lo);
        }
        *out = h;
        return true;
    }

    bool hash_equal(const stash::core::Hash256& a, const stash::core::Hash256& b) noexcept {
        u8 acc = 0;
        for (size_t i = 0; i < a.b.size(); ++i) {
            acc = static_cast<u8>(acc | static_cast<u8>(a.b[i] ^ b.b[i]));
        }
        return acc == 0;
    }
} // namespace stash::storage
