#pragma once
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "cop/core/buffer.hpp"
#include "cop/core/errors.hpp"
#include "cop/core/types.hpp"

#if !defined(COP_HAVE_LIBSODIUM) && !defined(COP_HAVE_OPENSSL)
#error "cop requires a crypto backend: define COP_HAVE_LIBSODIUM or COP_HAVE_OPENSSL"
#endif

namespace cop::security {
    using u8 = cop::core::u8;
    using u16 = cop::core::u16;
    using u32 = cop::core::u32;
    using BufferView = cop::core::BufferView;
    using BufferMut = cop::core::BufferMut;

    struct Key256 {
        u8 b[32]{};
    };

    struct Nonce12 {
        u8 b[12]{};
    };

    struct Tag16 {
        u8 b[16]{};
    };

    enum class AeadId : u8 {
        ChaCha20Poly1305 = 1,
    };

    // Nonce rules: one fresh random nonce per seal; a (key, nonce) pair is never reused.
    cop::core::Status aead_seal(AeadId aead,
        const Key256& key,
        const Nonce12& nonce,
        BufferView aad,
        BufferView pt,
        BufferMut ct_out,
        Tag16* tag_out) noexcept;

    // Fails with AuthFailure when the tag does not verify; pt_out is then scrubbed.
    cop::core::Status aead_open(AeadId aead,
        const Key256& key,
        const Nonce12& nonce,
        BufferView aad,
        BufferView ct,
        const Tag16& tag,
        BufferMut pt_out) noexcept;

    // CSPRNG of the active backend.
    cop::core::Status random_fill(BufferMut out) noexcept;
    cop::core::Status random_key(Key256* out) noexcept;
    cop::core::Status random_nonce(Nonce12* out) noexcept;

    // Zeroes secret material in a way the optimizer cannot drop.
    void secure_zero(void* p, std::size_t n) noexcept;

    [[nodiscard]] const char* backend_name() noexcept;

    // Heap scratch for secrets and plaintext; wiped when it goes out of scope.
    struct ScrubbedBytes {
        cop::core::Bytes v;

        ScrubbedBytes() = default;
        ScrubbedBytes(const ScrubbedBytes&) = delete;
        ScrubbedBytes& operator=(const ScrubbedBytes&) = delete;
        ~ScrubbedBytes() { secure_zero(v.data(), v.size()); }
    };

    static_assert(std::is_trivially_copyable_v<Key256>);
    static_assert(std::is_trivially_copyable_v<Nonce12>);
    static_assert(std::is_trivially_copyable_v<Tag16>);

} // namespace cop::security
