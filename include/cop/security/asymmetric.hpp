#pragma once

#include <type_traits>

#include "cop/core/errors.hpp"
#include "cop/core/types.hpp"
#include "cop/security/crypto.hpp"

namespace cop::security {

    // X25519 key agreement keys (raw 32-byte encodings).
    struct EncPrivateKey {
        u8 b[32]{};
    };

    struct EncPublicKey {
        u8 b[32]{};
    };

    struct SharedSecret {
        u8 b[32]{};
    };

    // Ed25519. The private key is the 32-byte seed.
    struct SigningPrivateKey {
        u8 b[32]{};
    };

    struct SigningPublicKey {
        u8 b[32]{};
    };

    struct Signature {
        u8 b[64]{};
    };

    struct EncKeyPair {
        EncPrivateKey priv{};
        EncPublicKey pub{};
    };

    struct SigningKeyPair {
        SigningPrivateKey priv{};
        SigningPublicKey pub{};
    };

    [[nodiscard]] bool key_equal(const EncPublicKey& a, const EncPublicKey& b) noexcept;
    [[nodiscard]] bool key_equal(const SigningPublicKey& a, const SigningPublicKey& b) noexcept;

    cop::core::Status enc_keypair_generate(EncKeyPair* out) noexcept;
    cop::core::Status enc_public_from_private(const EncPrivateKey& priv, EncPublicKey* out) noexcept;

    // Fails with Invalid when the peer key is malformed (all-zero shared secret).
    cop::core::Status derive_shared_secret(const EncPrivateKey& my_private,
        const EncPublicKey& their_public,
        SharedSecret* out) noexcept;

    cop::core::Status signing_keypair_generate(SigningKeyPair* out) noexcept;
    cop::core::Status signing_public_from_private(const SigningPrivateKey& priv, SigningPublicKey* out) noexcept;

    cop::core::Status sign_hash(const SigningPrivateKey& priv,
        const cop::core::Hash256& message_hash,
        Signature* out) noexcept;

    // Ok when the signature verifies, SignatureInvalid when it does not,
    // Invalid when the public key cannot be decoded.
    cop::core::Status verify_hash(const SigningPublicKey& pub,
        const cop::core::Hash256& message_hash,
        const Signature& sig) noexcept;

    static_assert(std::is_trivially_copyable_v<EncPrivateKey>);
    static_assert(std::is_trivially_copyable_v<EncPublicKey>);
    static_assert(std::is_trivially_copyable_v<SigningPrivateKey>);
    static_assert(std::is_trivially_copyable_v<SigningPublicKey>);
    static_assert(std::is_trivially_copyable_v<Signature>);

} // namespace cop::security
