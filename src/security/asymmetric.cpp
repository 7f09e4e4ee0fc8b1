#include "cop/security/asymmetric.hpp"

#include <cstddef>
#include <cstring>

#if defined(COP_HAVE_LIBSODIUM)
#include <sodium.h>
#elif defined(COP_HAVE_OPENSSL)
#include <openssl/evp.h>
#endif

namespace cop::security {
    using cop::core::Hash256;
    using cop::core::make_status;
    using cop::core::ok_status;
    using cop::core::Status;
    using cop::core::StatusCode;
    using cop::core::StatusDomain;

    namespace {
        template <std::size_t N>
        [[nodiscard]] bool bytes_equal_ct(const u8 (&a)[N], const u8 (&b)[N]) noexcept {
            u8 acc = 0;
            for (std::size_t i = 0; i < N; ++i) {
                acc = static_cast<u8>(acc | static_cast<u8>(a[i] ^ b[i]));
            }
            return acc == 0;
        }

        template <std::size_t N>
        [[nodiscard]] bool all_zero(const u8 (&a)[N]) noexcept {
            u8 acc = 0;
            for (std::size_t i = 0; i < N; ++i) {
                acc = static_cast<u8>(acc | a[i]);
            }
            return acc == 0;
        }

#if defined(COP_HAVE_LIBSODIUM)
        Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return make_status(StatusDomain::External, StatusCode::Unavailable);
            }
            return ok_status();
        }
#else
        // Owns an EVP_PKEY for the duration of one call.
        struct PkeyGuard {
            EVP_PKEY* p{nullptr};
            ~PkeyGuard() {
                if (p) EVP_PKEY_free(p);
            }
        };

        struct PkeyCtxGuard {
            EVP_PKEY_CTX* p{nullptr};
            ~PkeyCtxGuard() {
                if (p) EVP_PKEY_CTX_free(p);
            }
        };

        struct MdCtxGuard {
            EVP_MD_CTX* p{nullptr};
            ~MdCtxGuard() {
                if (p) EVP_MD_CTX_free(p);
            }
        };
#endif
    } // namespace

    bool key_equal(const EncPublicKey& a, const EncPublicKey& b) noexcept {
        return bytes_equal_ct(a.b, b.b);
    }

    bool key_equal(const SigningPublicKey& a, const SigningPublicKey& b) noexcept {
        return bytes_equal_ct(a.b, b.b);
    }

    Status enc_public_from_private(const EncPrivateKey& priv, EncPublicKey* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
#if defined(COP_HAVE_LIBSODIUM)
        const Status init = ensure_sodium();
        if (!cop::core::is_ok(init)) {
            return init;
        }
        if (crypto_scalarmult_base(out->b, priv.b) != 0) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        return ok_status();
#else
        PkeyGuard key{EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, priv.b, sizeof(priv.b))};
        if (key.p == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        size_t len = sizeof(out->b);
        if (EVP_PKEY_get_raw_public_key(key.p, out->b, &len) != 1 || len != sizeof(out->b)) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        return ok_status();
#endif
    }

    Status enc_keypair_generate(EncKeyPair* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        EncKeyPair kp{};
        Status s = random_fill(BufferMut{kp.priv.b, sizeof(kp.priv.b)});
        if (!cop::core::is_ok(s)) {
            return s;
        }
        s = enc_public_from_private(kp.priv, &kp.pub);
        if (!cop::core::is_ok(s)) {
            secure_zero(&kp, sizeof(kp));
            return s;
        }
        *out = kp;
        secure_zero(&kp, sizeof(kp));
        return ok_status();
    }

    Status derive_shared_secret(const EncPrivateKey& my_private,
        const EncPublicKey& their_public,
        SharedSecret* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
#if defined(COP_HAVE_LIBSODIUM)
        const Status init = ensure_sodium();
        if (!cop::core::is_ok(init)) {
            return init;
        }
        // Returns -1 when the result is the all-zero point.
        if (crypto_scalarmult(out->b, my_private.b, their_public.b) != 0) {
            secure_zero(out->b, sizeof(out->b));
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
#else
        PkeyGuard priv{EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, my_private.b, sizeof(my_private.b))};
        PkeyGuard peer{EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr, their_public.b, sizeof(their_public.b))};
        if (priv.p == nullptr || peer.p == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        PkeyCtxGuard ctx{EVP_PKEY_CTX_new(priv.p, nullptr)};
        if (ctx.p == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Unavailable);
        }
        size_t len = sizeof(out->b);
        if (EVP_PKEY_derive_init(ctx.p) <= 0 ||
            EVP_PKEY_derive_set_peer(ctx.p, peer.p) <= 0 ||
            EVP_PKEY_derive(ctx.p, out->b, &len) <= 0 ||
            len != sizeof(out->b)) {
            secure_zero(out->b, sizeof(out->b));
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
#endif
        if (all_zero(out->b)) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        return ok_status();
    }

    Status signing_public_from_private(const SigningPrivateKey& priv, SigningPublicKey* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
#if defined(COP_HAVE_LIBSODIUM)
        const Status init = ensure_sodium();
        if (!cop::core::is_ok(init)) {
            return init;
        }
        u8 sk[crypto_sign_SECRETKEYBYTES];
        const int rc = crypto_sign_seed_keypair(out->b, sk, priv.b);
        sodium_memzero(sk, sizeof(sk));
        if (rc != 0) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        return ok_status();
#else
        PkeyGuard key{EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, priv.b, sizeof(priv.b))};
        if (key.p == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        size_t len = sizeof(out->b);
        if (EVP_PKEY_get_raw_public_key(key.p, out->b, &len) != 1 || len != sizeof(out->b)) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        return ok_status();
#endif
    }

    Status signing_keypair_generate(SigningKeyPair* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        SigningKeyPair kp{};
        Status s = random_fill(BufferMut{kp.priv.b, sizeof(kp.priv.b)});
        if (!cop::core::is_ok(s)) {
            return s;
        }
        s = signing_public_from_private(kp.priv, &kp.pub);
        if (!cop::core::is_ok(s)) {
            secure_zero(&kp, sizeof(kp));
            return s;
        }
        *out = kp;
        secure_zero(&kp, sizeof(kp));
        return ok_status();
    }

    Status sign_hash(const SigningPrivateKey& priv, const Hash256& message_hash, Signature* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
#if defined(COP_HAVE_LIBSODIUM)
        const Status init = ensure_sodium();
        if (!cop::core::is_ok(init)) {
            return init;
        }
        u8 pk[crypto_sign_PUBLICKEYBYTES];
        u8 sk[crypto_sign_SECRETKEYBYTES];
        int rc = crypto_sign_seed_keypair(pk, sk, priv.b);
        if (rc == 0) {
            rc = crypto_sign_detached(out->b, nullptr, message_hash.b.data(), message_hash.b.size(), sk);
        }
        sodium_memzero(sk, sizeof(sk));
        if (rc != 0) {
            return make_status(StatusDomain::Security, StatusCode::Unknown);
        }
        return ok_status();
#else
        PkeyGuard key{EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, priv.b, sizeof(priv.b))};
        if (key.p == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        MdCtxGuard ctx{EVP_MD_CTX_new()};
        if (ctx.p == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Unavailable);
        }
        size_t sig_len = sizeof(out->b);
        if (EVP_DigestSignInit(ctx.p, nullptr, nullptr, nullptr, key.p) != 1 ||
            EVP_DigestSign(ctx.p, out->b, &sig_len, message_hash.b.data(), message_hash.b.size()) != 1 ||
            sig_len != sizeof(out->b)) {
            return make_status(StatusDomain::Security, StatusCode::Unknown);
        }
        return ok_status();
#endif
    }

    Status verify_hash(const SigningPublicKey& pub, const Hash256& message_hash, const Signature& sig) noexcept {
#if defined(COP_HAVE_LIBSODIUM)
        const Status init = ensure_sodium();
        if (!cop::core::is_ok(init)) {
            return init;
        }
        if (crypto_core_ed25519_is_valid_point(pub.b) != 1) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        if (crypto_sign_verify_detached(sig.b, message_hash.b.data(), message_hash.b.size(), pub.b) != 0) {
            return make_status(StatusDomain::Security, StatusCode::SignatureInvalid);
        }
        return ok_status();
#else
        PkeyGuard key{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, pub.b, sizeof(pub.b))};
        if (key.p == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        MdCtxGuard ctx{EVP_MD_CTX_new()};
        if (ctx.p == nullptr) {
            return make_status(StatusDomain::Security, StatusCode::Unavailable);
        }
        if (EVP_DigestVerifyInit(ctx.p, nullptr, nullptr, nullptr, key.p) != 1) {
            return make_status(StatusDomain::Security, StatusCode::Invalid);
        }
        if (EVP_DigestVerify(ctx.p, sig.b, sizeof(sig.b), message_hash.b.data(), message_hash.b.size()) != 1) {
            return make_status(StatusDomain::Security, StatusCode::SignatureInvalid);
        }
        return ok_status();
#endif
    }
} // namespace cop::security
