#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace cop::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Seconds since the Unix epoch, always supplied by the caller.
    using Timestamp = i64;

    using Bytes = std::vector<u8>;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(const Hash256&, const Hash256&) noexcept = default;
        friend constexpr auto operator<=>(const Hash256&, const Hash256&) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);
    static_assert(std::is_trivially_copyable_v<Hash256>);

    [[nodiscard]] constexpr bool hash_is_zero(const Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // Constant-time comparison for digests that gate access decisions.
    [[nodiscard]] inline bool hash_equal_ct(const Hash256& a, const Hash256& b) noexcept {
        u8 acc = 0;
        for (std::size_t i = 0; i < a.b.size(); ++i) {
            acc = static_cast<u8>(acc | static_cast<u8>(a.b[i] ^ b.b[i]));
        }
        return acc == 0;
    }

} // namespace cop::core
