#include <array>
#include <cstring>
#include <string>

#include <gtest/gtest.h>

#include "cop/core/encoding.hpp"
#include "cop/core/errors.hpp"
#include "cop/core/types.hpp"

using namespace cop::core;

TEST(CoreStatus, OkAndMakeStatus) {
    EXPECT_TRUE(is_ok(ok_status()));
    const Status s = make_status(StatusDomain::Store, StatusCode::Io, 2);
    EXPECT_FALSE(is_ok(s));
    EXPECT_EQ(s.domain, StatusDomain::Store);
    EXPECT_EQ(s.aux, 2u);
}

TEST(CoreStatus, NamesAreDistinctForProtocolOutcomes) {
    const StatusCode codes[] = {
        StatusCode::Structural,
        StatusCode::AuthFailure,
        StatusCode::UnwrapFailure,
        StatusCode::HashMismatch,
        StatusCode::SignatureInvalid,
        StatusCode::AccessDenied,
        StatusCode::NotFound,
    };
    for (std::size_t i = 0; i < std::size(codes); ++i) {
        for (std::size_t j = i + 1; j < std::size(codes); ++j) {
            EXPECT_STRNE(status_code_name(codes[i]), status_code_name(codes[j]));
        }
    }
    EXPECT_STREQ(status_code_name(StatusCode::Structural), "StructuralError");
    EXPECT_STREQ(status_domain_name(StatusDomain::Protocol), "Protocol");
}

TEST(CoreTypes, HashHelpers) {
    Hash256 a{};
    EXPECT_TRUE(hash_is_zero(a));
    Hash256 b{};
    b.b[31] = 1;
    EXPECT_FALSE(hash_is_zero(b));
    EXPECT_FALSE(hash_equal_ct(a, b));
    a.b[31] = 1;
    EXPECT_TRUE(hash_equal_ct(a, b));
}

TEST(CoreEncoding, HexLowercase) {
    const u8 raw[] = {0x00, 0xff, 0x10, 0xab};
    EXPECT_EQ(hex_encode({raw, 4}), "00ff10ab");
    EXPECT_EQ(hex_encode({nullptr, 0}), "");
}

TEST(CoreEncoding, Base64UrlUnpadded) {
    const char* text = "hello";
    const BufferView in{reinterpret_cast<const u8*>(text), 5};
    EXPECT_EQ(base64url_encode(in), "aGVsbG8");

    const u8 raw[] = {0xfb, 0xff};
    EXPECT_EQ(base64url_encode({raw, 2}), "-_8");
}

TEST(CoreEncoding, Base64UrlDecodeAcceptsPadding) {
    Bytes out;
    ASSERT_TRUE(is_ok(base64url_decode("aGVsbG8=", &out)));
    ASSERT_EQ(out.size(), 5u);
    EXPECT_EQ(std::memcmp(out.data(), "hello", 5), 0);

    ASSERT_TRUE(is_ok(base64url_decode("aGVsbG8", &out)));
    EXPECT_EQ(out.size(), 5u);
}

TEST(CoreEncoding, Base64UrlRejectsForeignAlphabet) {
    Bytes out;
    EXPECT_EQ(base64url_decode("aGV+bG8", &out).code, StatusCode::Structural);
    EXPECT_EQ(base64url_decode("a", &out).code, StatusCode::Structural);
}

TEST(CoreEncoding, DecodeExactChecksWidth) {
    std::array<u8, 4> four{};
    EXPECT_TRUE(is_ok(base64url_decode_exact("AAECAw", {four.data(), 4})));
    EXPECT_EQ(four[3], 3);

    std::array<u8, 8> eight{};
    EXPECT_EQ(base64url_decode_exact("AAECAw", {eight.data(), 8}).code, StatusCode::Structural);
}
