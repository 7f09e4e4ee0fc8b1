#include "cop/security/kdf.hpp"

#include <cstddef>
#include <cstring>
#include <vector>

#if defined(COP_HAVE_LIBSODIUM)
#include <sodium.h>
#elif defined(COP_HAVE_OPENSSL)
#include <openssl/evp.h>
#include <openssl/hmac.h>
#endif

namespace cop::security {
    using cop::core::make_status;
    using cop::core::ok_status;
    using cop::core::Status;
    using cop::core::StatusCode;
    using cop::core::StatusDomain;

    namespace {
        constexpr u32 kHashLen = 32;

        void append(std::vector<u8>& out, BufferView b) {
            if (b.len > 0) {
                out.insert(out.end(), b.data, b.data + b.len);
            }
        }
    } // namespace

    const char* kdf_label(KdfContext ctx) noexcept {
        switch (ctx) {
            case KdfContext::ContentWrap: return "cop.kdf.content_wrap.v1";
            case KdfContext::ShareWrap: return "cop.kdf.share_wrap.v1";
        }
        return "";
    }

    Status hmac_sha256(BufferView key, BufferView msg, Key256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        if (!cop::core::buffer_ok(key) || !cop::core::buffer_ok(msg)) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }

#if defined(COP_HAVE_LIBSODIUM)
        if (sodium_init() < 0) {
            return make_status(StatusDomain::External, StatusCode::Unavailable);
        }
        crypto_auth_hmacsha256_state st;
        int rc = crypto_auth_hmacsha256_init(&st, key.data, key.len);
        if (rc == 0 && msg.len > 0) {
            rc = crypto_auth_hmacsha256_update(&st, msg.data, msg.len);
        }
        if (rc == 0) {
            rc = crypto_auth_hmacsha256_final(&st, out->b);
        }
        sodium_memzero(&st, sizeof(st));
        if (rc != 0) {
            return make_status(StatusDomain::Security, StatusCode::Unknown);
        }
        return ok_status();
#else
        static const u8 kEmpty[1] = {0};
        unsigned int out_len = 0;
        const u8* res = HMAC(EVP_sha256(),
            key.len > 0 ? key.data : kEmpty,
            static_cast<int>(key.len),
            msg.len > 0 ? msg.data : kEmpty,
            static_cast<size_t>(msg.len),
            out->b,
            &out_len);
        if (res == nullptr || out_len != kHashLen) {
            return make_status(StatusDomain::Security, StatusCode::Unknown);
        }
        return ok_status();
#endif
    }

    Status hkdf_extract(BufferView salt, BufferView ikm, Key256* prk_out) noexcept {
        if (prk_out == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        if (!cop::core::buffer_ok(salt) || !cop::core::buffer_ok(ikm)) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        static const u8 kZeroSalt[kHashLen] = {};
        const BufferView effective_salt = salt.len > 0 ? salt : BufferView{kZeroSalt, kHashLen};
        return hmac_sha256(effective_salt, ikm, prk_out);
    }

    Status hkdf_expand(const Key256& prk, BufferView info, BufferMut out) noexcept {
        if (!cop::core::buffer_ok(info) || !cop::core::buffer_ok(out)) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        if (out.len > 255 * kHashLen) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }

        // T(i) = HMAC(PRK, T(i-1) || info || i)
        Key256 t{};
        u32 t_len = 0;
        u32 written = 0;
        ScrubbedBytes block;
        block.v.reserve(kHashLen + info.len + 1);

        for (u32 i = 1; written < out.len; ++i) {
            block.v.clear();
            append(block.v, BufferView{t.b, t_len});
            append(block.v, info);
            block.v.push_back(static_cast<u8>(i));

            const Status s = hmac_sha256(BufferView{prk.b, kHashLen},
                BufferView{block.v.data(), static_cast<u32>(block.v.size())}, &t);
            if (!cop::core::is_ok(s)) {
                secure_zero(&t, sizeof(t));
                secure_zero(out.data, out.len);
                return s;
            }
            t_len = kHashLen;

            const u32 n = (out.len - written) < kHashLen ? (out.len - written) : kHashLen;
            std::memcpy(out.data + written, t.b, n);
            written += n;
        }

        secure_zero(&t, sizeof(t));
        return ok_status();
    }

    Status kdf_derive(BufferView secret, KdfContext ctx, BufferView binding, Key256* out_key) noexcept {
        if (out_key == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        if (!cop::core::buffer_ok(secret) || !cop::core::buffer_ok(binding) || secret.len == 0) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }

        Key256 prk{};
        Status s = hkdf_extract(BufferView{nullptr, 0}, secret, &prk);
        if (!cop::core::is_ok(s)) {
            return s;
        }

        const char* label = kdf_label(ctx);
        ScrubbedBytes info;
        info.v.reserve(std::strlen(label) + binding.len);
        append(info.v, cop::core::view_of(label));
        append(info.v, binding);

        s = hkdf_expand(prk, BufferView{info.v.data(), static_cast<u32>(info.v.size())},
            BufferMut{out_key->b, sizeof(out_key->b)});
        secure_zero(&prk, sizeof(prk));
        return s;
    }
} // namespace cop::security
