#pragma once

#include <string_view>

#include "cop/core/buffer.hpp"
#include "cop/core/types.hpp"

namespace cop::protocol {
    using u8 = cop::core::u8;
    using u32 = cop::core::u32;

    // Unambiguous byte string for associated data and aggregate hashing.
    // Variable-length fields carry a u32 big-endian length prefix.
    class Transcript {
    public:
        explicit Transcript(std::string_view label) { put_str(label); }

        void put_u8(u8 v) { bytes_.push_back(v); }

        void put_u32(u32 v) {
            bytes_.push_back(static_cast<u8>((v >> 24) & 0xffu));
            bytes_.push_back(static_cast<u8>((v >> 16) & 0xffu));
            bytes_.push_back(static_cast<u8>((v >> 8) & 0xffu));
            bytes_.push_back(static_cast<u8>(v & 0xffu));
        }

        void put_bytes(cop::core::BufferView b) {
            put_u32(b.len);
            if (b.len > 0) {
                bytes_.insert(bytes_.end(), b.data, b.data + b.len);
            }
        }

        void put_str(std::string_view s) { put_bytes(cop::core::view_of(s)); }

        void put_hash(const cop::core::Hash256& h) { put_bytes(cop::core::view_of(h)); }

        [[nodiscard]] cop::core::BufferView view() const noexcept { return cop::core::view_of(bytes_); }

    private:
        cop::core::Bytes bytes_;
    };

} // namespace cop::protocol
