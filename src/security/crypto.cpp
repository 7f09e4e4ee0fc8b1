#include "cop/security/crypto.hpp"

#include <cstddef>
#include <cstring>
#include <limits>

#if defined(COP_HAVE_LIBSODIUM)
#include <sodium.h>
#elif defined(COP_HAVE_OPENSSL)
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#endif

namespace cop::security {
    using cop::core::make_status;
    using cop::core::ok_status;
    using cop::core::Status;
    using cop::core::StatusCode;
    using cop::core::StatusDomain;

    namespace {
#if defined(COP_HAVE_LIBSODIUM)
        Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return make_status(StatusDomain::External, StatusCode::Unavailable);
            }
            return ok_status();
        }
#endif
    } // namespace

    Status aead_seal(AeadId aead,
        const Key256& key,
        const Nonce12& nonce,
        BufferView aad,
        BufferView pt,
        BufferMut ct_out,
        Tag16* tag_out) noexcept {
        if (tag_out == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        if (!cop::core::buffer_ok(aad) || !cop::core::buffer_ok(pt) || !cop::core::buffer_ok(ct_out)) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        if (ct_out.len < pt.len) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }

        if (aead != AeadId::ChaCha20Poly1305) {
            return make_status(StatusDomain::Security, StatusCode::Unsupported);
        }

#if defined(COP_HAVE_LIBSODIUM)
        const Status init = ensure_sodium();
        if (!cop::core::is_ok(init)) {
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
            nonce.b,
            key.b);

        if (rc != 0 || mac_len != sizeof(tag_out->b)) {
            return make_status(StatusDomain::Security, StatusCode::Unknown);
        }
        return ok_status();
#else
        if (aad.len > static_cast<u32>(std::numeric_limits<int>::max()) ||
            pt.len > static_cast<u32>(std::numeric_limits<int>::max())) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }

        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        if (!ctx) {
            return make_status(StatusDomain::Security, StatusCode::Unavailable);
        }

        int ok = 1;
        ok &= EVP_EncryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr);
        ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, 12, nullptr);
        ok &= EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.b, nonce.b);

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

        ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, 16, tag_out->b);
        EVP_CIPHER_CTX_free(ctx);

        if (!ok || static_cast<u32>(ct_written) != pt.len) {
            return make_status(StatusDomain::Security, StatusCode::Unknown);
        }
        return ok_status();
#endif
    }

    Status aead_open(AeadId aead,
        const Key256& key,
        const Nonce12& nonce,
        BufferView aad,
        BufferView ct,
        const Tag16& tag,
        BufferMut pt_out) noexcept {
        if (!cop::core::buffer_ok(aad) || !cop::core::buffer_ok(ct) || !cop::core::buffer_ok(pt_out)) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        if (pt_out.len < ct.len) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }

        if (aead != AeadId::ChaCha20Poly1305) {
            return make_status(StatusDomain::Security, StatusCode::Unsupported);
        }

#if defined(COP_HAVE_LIBSODIUM)
        const Status init = ensure_sodium();
        if (!cop::core::is_ok(init)) {
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
            nonce.b,
            key.b);

        if (rc != 0) {
            secure_zero(pt_out.data, pt_out.len);
            return make_status(StatusDomain::Security, StatusCode::AuthFailure);
        }
        return ok_status();
#else
        if (aad.len > static_cast<u32>(std::numeric_limits<int>::max()) ||
            ct.len > static_cast<u32>(std::numeric_limits<int>::max())) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }

        EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
        if (!ctx) {
            return make_status(StatusDomain::Security, StatusCode::Unavailable);
        }

        int ok = 1;
        ok &= EVP_DecryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr);
        ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, 12, nullptr);
        ok &= EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.b, nonce.b);

        int out_len = 0;
        if (aad.len > 0) {
            ok &= EVP_DecryptUpdate(ctx, nullptr, &out_len, aad.data, static_cast<int>(aad.len));
        }

        int pt_written = 0;
        if (ct.len > 0) {
            ok &= EVP_DecryptUpdate(ctx, pt_out.data, &out_len, ct.data, static_cast<int>(ct.len));
            pt_written += out_len;
        }

        ok &= EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, 16, const_cast<u8*>(tag.b));
        const int final_ok = EVP_DecryptFinal_ex(ctx, pt_out.data + pt_written, &out_len);
        EVP_CIPHER_CTX_free(ctx);

        if (!ok) {
            secure_zero(pt_out.data, pt_out.len);
            return make_status(StatusDomain::Security, StatusCode::Unknown);
        }
        if (final_ok <= 0) {
            secure_zero(pt_out.data, pt_out.len);
            return make_status(StatusDomain::Security, StatusCode::AuthFailure);
        }
        pt_written += out_len;
        if (static_cast<u32>(pt_written) != ct.len) {
            secure_zero(pt_out.data, pt_out.len);
            return make_status(StatusDomain::Security, StatusCode::Unknown);
        }
        return ok_status();
#endif
    }

    Status random_fill(BufferMut out) noexcept {
        if (!cop::core::buffer_ok(out)) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        if (out.len == 0) {
            return ok_status();
        }
#if defined(COP_HAVE_LIBSODIUM)
        const Status init = ensure_sodium();
        if (!cop::core::is_ok(init)) {
            return init;
        }
        randombytes_buf(out.data, out.len);
        return ok_status();
#else
        if (out.len > static_cast<u32>(std::numeric_limits<int>::max())) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        if (RAND_bytes(out.data, static_cast<int>(out.len)) != 1) {
            return make_status(StatusDomain::Security, StatusCode::Unavailable);
        }
        return ok_status();
#endif
    }

    Status random_key(Key256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        return random_fill(BufferMut{out->b, sizeof(out->b)});
    }

    Status random_nonce(Nonce12* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        return random_fill(BufferMut{out->b, sizeof(out->b)});
    }

    void secure_zero(void* p, std::size_t n) noexcept {
        if (p == nullptr || n == 0) {
            return;
        }
#if defined(COP_HAVE_LIBSODIUM)
        sodium_memzero(p, n);
#else
        OPENSSL_cleanse(p, n);
#endif
    }

    const char* backend_name() noexcept {
#if defined(COP_HAVE_LIBSODIUM)
        return "libsodium";
#else
        return "openssl";
#endif
    }
} // namespace cop::security
