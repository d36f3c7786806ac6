#include "stash/security/crypto.hpp"

#include <cstddef>
#include <cstring>
#include <utility>

#if defined(STASH_HAVE_LIBSODIUM)
#include <sodium.h>
#endif

#if defined(STASH_HAVE_OPENSSL)
#include <openssl/evp.h>
#include <openssl/rand.h>
#endif

#include "stash/storage/hashing.hpp"

namespace stash::security {
    namespace {
        [[nodiscard]] bool buffer_ok_mut(BufferMut b) noexcept {
            return (b.len == 0) || (b.data != nullptr);
        }

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

#if defined(STASH_HAVE_LIBSODIUM)
        stash::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Unavailable);
            }
            return stash::core::ok_status();
        }
#endif
    } // namespace

    stash::core::Status aead_seal(AeadId aead,
        const Key256& key,
        const Nonce12& nonce,
        BufferView aad,
        BufferView pt,
        BufferMut ct_out,
        Tag16* tag_out) noexcept {
        if (tag_out == nullptr) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Invalid);
        }
        if (!stash::storage::buffer_ok(aad) || !stash::storage::buffer_ok(pt) || !buffer_ok_mut(ct_out)) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Invalid);
        }
        if (ct_out.len < pt.len) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Invalid);
        }

        if (aead != AeadId::ChaCha20Poly1305) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Unsupported);
        }

#if defined(STASH_HAVE_LIBSODIUM)
        const stash::core::Status init = ensure_sodium();
        if (!stash::core::is_ok(init)) {
            return init;
        }

        unsigned long long mac_len = 0;

        const int rc = crypto_aead_chacha20poly1305_ietf_encrypt_detached(
            ct_out.data,
            tag_out->b,
            &mac_len,
            pt.data,
            static_cast<unsigned long long>(pt.len),
            aad.data,
            static_cast<unsigned long long>(aad.len),
            nullptr,
            nonce.b.data(),
            key.b);

        if (rc != 0 || mac_len != sizeof(tag_out->b)) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Crypto);
        }
        return stash::core::ok_status();
#elif defined(STASH_HAVE_OPENSSL)
        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        if (!ctx) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Unavailable);
        }

        int ok = 1;
        ok &= EVP_EncryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr);
        ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, kNonceBytes, nullptr);
        ok &= EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.b, nonce.b.data());

        int out_len = 0;
        if (aad.len > 0) {
            ok &= EVP_EncryptUpdate(ctx, nullptr, &out_len, aad.data, static_cast<int>(aad.len));
        }

        int ct_written = 0;
        if (pt.len > 0) {
            ok &= EVP_EncryptUpdate(ctx, ct_out.data, &out_len, pt.data, static_cast<int>(pt.len));
            ct_written += out_len;
        }

        ok &= EVP_EncryptFinal_ex(ctx, ct_out.data + ct_written, &out_len);
        ct_written += out_len;

        ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, kTagBytes, tag_out->b);
        EVP_CIPHER_CTX_free(ctx);

        if (!ok || static_cast<u32>(ct_written) != pt.len) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Crypto);
        }
        return stash::core::ok_status();
#else
        (void)key;
        (void)nonce;
        (void)aad;
        (void)pt;
        (void)ct_out;
        std::memset(tag_out->b, 0, sizeof(tag_out->b));
        return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Unavailable);
#endif
    }

    stash::core::Status aead_open(AeadId aead,
        const Key256& key,
        const Nonce12& nonce,
        BufferView aad,
        BufferView ct,
        const Tag16& tag,
        BufferMut pt_out) noexcept {
        if (!stash::storage::buffer_ok(aad) || !stash::storage::buffer_ok(ct) || !buffer_ok_mut(pt_out)) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Invalid);
        }
        if (pt_out.len < ct.len) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Invalid);
        }

        if (aead != AeadId::ChaCha20Poly1305) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Unsupported);
        }

#if defined(STASH_HAVE_LIBSODIUM)
        const stash::core::Status init = ensure_sodium();
        if (!stash::core::is_ok(init)) {
            return init;
        }

        const int rc = crypto_aead_chacha20poly1305_ietf_decrypt_detached(
            pt_out.data,
            nullptr,
            ct.data,
            static_cast<unsigned long long>(ct.len),
            tag.b,
            aad.data,
            static_cast<unsigned long long>(aad.len),
            nonce.b.data(),
            key.b);

        if (rc != 0) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Crypto);
        }
        return stash::core::ok_status();
#elif defined(STASH_HAVE_OPENSSL)
        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        if (!ctx) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Unavailable);
        }

        int ok = 1;
        ok &= EVP_DecryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr);
        ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, kNonceBytes, nullptr);
        ok &= EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.b, nonce.b.data());

        int out_len = 0;
        if (aad.len > 0) {
            ok &= EVP_DecryptUpdate(ctx, nullptr, &out_len, aad.data, static_cast<int>(aad.len));
        }

        int pt_written = 0;
        if (ct.len > 0) {
            ok &= EVP_DecryptUpdate(ctx, pt_out.data, &out_len, ct.data, static_cast<int>(ct.len));
            pt_written += out_len;
        }

        ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, kTagBytes, const_cast<u8*>(tag.b));
        const int final_ok = EVP_DecryptFinal_ex(ctx, pt_out.data + pt_written, &out_len);
        EVP_CIPHER_CTX_free(ctx);

        if (!ok || final_ok <= 0) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Crypto);
        }
        pt_written += out_len;
        if (static_cast<u32>(pt_written) != ct.len) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Crypto);
        }
        return stash::core::ok_status();
#else
        (void)key;
        (void)nonce;
        (void)aad;
        (void)ct;
        (void)tag;
        (void)pt_out;
        return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Unavailable);
#endif
    }

    stash::core::Status random_bytes(BufferMut out) noexcept {
        if (!buffer_ok_mut(out)) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Invalid);
        }
        if (out.len == 0) {
            return stash::core::ok_status();
        }
#if defined(STASH_HAVE_LIBSODIUM)
        const stash::core::Status init = ensure_sodium();
        if (!stash::core::is_ok(init)) {
            return init;
        }
        randombytes_buf(out.data, static_cast<size_t>(out.len));
        return stash::core::ok_status();
#elif defined(STASH_HAVE_OPENSSL)
        if (RAND_bytes(out.data, static_cast<int>(out.len)) != 1) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Unavailable);
        }
        return stash::core::ok_status();
#else
        return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Unavailable);
#endif
    }

    stash::core::Status seal_box(const Key256& key,
        BufferView pt,
        std::vector<u8>* out,
        Nonce12* nonce_out) noexcept {
        if (out == nullptr || !stash::storage::buffer_ok(pt)) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Invalid);
        }

        Nonce12 nonce{};
        stash::core::Status s = random_bytes(BufferMut{nonce.b.data(), kNonceBytes});
        if (!stash::core::is_ok(s)) {
            return s;
        }

        out->assign(static_cast<size_t>(pt.len) + kSealedOverhead, 0);
        std::memcpy(out->data(), nonce.b.data(), kNonceBytes);

        Tag16 tag{};
        BufferMut ct{out->data() + kNonceBytes, pt.len};
        s = aead_seal(AeadId::ChaCha20Poly1305, key, nonce, BufferView{}, pt, ct, &tag);
        if (!stash::core::is_ok(s)) {
            out->clear();
            return s;
        }
        std::memcpy(out->data() + kNonceBytes + pt.len, tag.b, kTagBytes);

        if (nonce_out != nullptr) {
            *nonce_out = nonce;
        }
        return stash::core::ok_status();
    }

    stash::core::Status open_box(const Key256& key,
        BufferView sealed,
        std::vector<u8>* pt_out) noexcept {
        if (pt_out == nullptr || !stash::storage::buffer_ok(sealed)) {
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Invalid);
        }
        if (sealed.len < kSealedOverhead) {
            // Too short to carry nonce and tag: truncated
            return stash::core::make_status(stash::core::StatusDomain::Security, stash::core::StatusCode::Crypto);
        }

        Nonce12 nonce{};
        std::memcpy(nonce.b.data(), sealed.data, kNonceBytes);

        const u32 ct_len = sealed.len - kSealedOverhead;
        Tag16 tag{};
        std::memcpy(tag.b, sealed.data + kNonceBytes + ct_len, kTagBytes);

        // Keep a valid output pointer for empty payloads
        std::vector<u8> pt(ct_len > 0 ? ct_len : 1);
        const stash::core::Status s = aead_open(AeadId::ChaCha20Poly1305,
            key,
            nonce,
            BufferView{},
            BufferView{sealed.data + kNonceBytes, ct_len},
            tag,
            BufferMut{pt.data(), ct_len});
        if (!stash::core::is_ok(s)) {
            return s;
        }
        pt.resize(ct_len);
        *pt_out = std::move(pt);
        return stash::core::ok_status();
    }

    bool key_from_hex(std::string_view hex, Key256* out) noexcept {
        if (out == nullptr || hex.size() != sizeof(out->b) * 2) {
            return false;
        }
        Key256 k{};
        for (size_t i = 0; i < sizeof(k.b); ++i) {
            const int hi = hex_value(hex[2 * i]);
            const int lo = hex_value(hex[2 * i + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            k.b[i] = static_cast<u8>((hi << 4) | lo);
        }
        *out = k;
        return true;
    }

    std::string key_id(const Key256& key) {
        stash::core::Hash256 h{};
        if (!stash::core::is_ok(stash::storage::hash_compute(BufferView{key.b, sizeof(key.b)}, &h))) {
            return std::string{};
        }
        return stash::storage::hash_to_hex(h).substr(0, 16);
    }
} // namespace stash::security
