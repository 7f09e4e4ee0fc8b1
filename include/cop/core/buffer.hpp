#pragma once

#include <string>
#include <string_view>
#include <type_traits>

#include "cop/core/types.hpp"

namespace cop::core {

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    [[nodiscard]] constexpr bool buffer_ok(BufferMut b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    [[nodiscard]] inline BufferView view_of(const Bytes& b) noexcept {
        return BufferView{b.data(), static_cast<u32>(b.size())};
    }

    [[nodiscard]] inline BufferView view_of(std::string_view s) noexcept {
        return BufferView{reinterpret_cast<const u8*>(s.data()), static_cast<u32>(s.size())};
    }

    [[nodiscard]] inline BufferView view_of(const Hash256& h) noexcept {
        return BufferView{h.b.data(), static_cast<u32>(h.b.size())};
    }

    [[nodiscard]] inline BufferMut mut_of(Bytes& b) noexcept {
        return BufferMut{b.data(), static_cast<u32>(b.size())};
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace cop::core
