#include "cop/core/encoding.hpp"

#include <cstring>
#include <utility>

namespace cop::core {
    namespace {
        constexpr char kHex[] = "0123456789abcdef";
        constexpr char kB64Url[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

        [[nodiscard]] int b64url_value(char c) noexcept {
            if (c >= 'A' && c <= 'Z') return c - 'A';
            if (c >= 'a' && c <= 'z') return c - 'a' + 26;
            if (c >= '0' && c <= '9') return c - '0' + 52;
            if (c == '-') return 62;
            if (c == '_') return 63;
            return -1;
        }
    } // namespace

    std::string hex_encode(BufferView in) {
        std::string out;
        if (!buffer_ok(in)) {
            return out;
        }
        out.reserve(static_cast<std::size_t>(in.len) * 2);
        for (u32 i = 0; i < in.len; ++i) {
            out.push_back(kHex[(in.data[i] >> 4) & 0xF]);
            out.push_back(kHex[in.data[i] & 0xF]);
        }
        return out;
    }

    std::string base64url_encode(BufferView in) {
        std::string out;
        if (!buffer_ok(in)) {
            return out;
        }
        out.reserve((static_cast<std::size_t>(in.len) * 4 + 2) / 3);

        u32 i = 0;
        for (; i + 3 <= in.len; i += 3) {
            const u32 v = (static_cast<u32>(in.data[i]) << 16) |
                (static_cast<u32>(in.data[i + 1]) << 8) |
                static_cast<u32>(in.data[i + 2]);
            out.push_back(kB64Url[(v >> 18) & 0x3F]);
            out.push_back(kB64Url[(v >> 12) & 0x3F]);
            out.push_back(kB64Url[(v >> 6) & 0x3F]);
            out.push_back(kB64Url[v & 0x3F]);
        }

        const u32 rem = in.len - i;
        if (rem == 1) {
            const u32 v = static_cast<u32>(in.data[i]) << 16;
            out.push_back(kB64Url[(v >> 18) & 0x3F]);
            out.push_back(kB64Url[(v >> 12) & 0x3F]);
        } else if (rem == 2) {
            const u32 v = (static_cast<u32>(in.data[i]) << 16) | (static_cast<u32>(in.data[i + 1]) << 8);
            out.push_back(kB64Url[(v >> 18) & 0x3F]);
            out.push_back(kB64Url[(v >> 12) & 0x3F]);
            out.push_back(kB64Url[(v >> 6) & 0x3F]);
        }
        return out;
    }

    Status base64url_decode(std::string_view in, Bytes* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        while (!in.empty() && in.back() == '=') {
            in.remove_suffix(1);
        }
        if (in.size() % 4 == 1) {
            return make_status(StatusDomain::Core, StatusCode::Structural);
        }

        Bytes decoded;
        decoded.reserve(in.size() * 3 / 4);

        u32 acc = 0;
        u32 bits = 0;
        for (char c : in) {
            const int v = b64url_value(c);
            if (v < 0) {
                return make_status(StatusDomain::Core, StatusCode::Structural);
            }
            acc = (acc << 6) | static_cast<u32>(v);
            bits += 6;
            if (bits >= 8) {
                bits -= 8;
                decoded.push_back(static_cast<u8>((acc >> bits) & 0xFFu));
            }
        }
        // Leftover bits must be zero for a canonical encoding.
        if ((acc & ((1u << bits) - 1u)) != 0) {
            return make_status(StatusDomain::Core, StatusCode::Structural);
        }

        *out = std::move(decoded);
        return ok_status();
    }

    Status base64url_decode_exact(std::string_view in, BufferMut out) noexcept {
        if (!buffer_ok(out)) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        Bytes tmp;
        const Status s = base64url_decode(in, &tmp);
        if (!is_ok(s)) {
            return s;
        }
        if (tmp.size() != out.len) {
            return make_status(StatusDomain::Core, StatusCode::Structural);
        }
        if (out.len > 0) {
            std::memcpy(out.data, tmp.data(), out.len);
        }
        return ok_status();
    }
} // namespace cop::core
