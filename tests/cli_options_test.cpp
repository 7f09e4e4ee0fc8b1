#include <array>

#include <gtest/gtest.h>

#include "cop/cli/options.hpp"

TEST(CliOptions, ParsesLongAndShortAndStopsAtCommand) {
    const std::array<cop::cli::OptionSpec, 4> specs = {{
        {cop::cli::OptionId::KeysDir, cop::cli::OptionType::String, "keys-dir", 'k'},
        {cop::cli::OptionId::Db, cop::cli::OptionType::String, "db", 'd'},
        {cop::cli::OptionId::At, cop::cli::OptionType::I64, "at", '\0'},
        {cop::cli::OptionId::Help, cop::cli::OptionType::Flag, "help", 'h'},
    }};

    const char* argv[] = {"--help", "--keys-dir", "/k", "-d", "cop.db", "protect", "doc.json"};
    const cop::cli::CliArgs args{argv, 7};

    cop::cli::ParsedOption buf[8]{};
    cop::cli::ParsedOptions out{buf, 0, 8};
    cop::cli::u32 consumed = 0;
    const cop::core::Status s = cop::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, cop::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 5u);
    ASSERT_EQ(out.len, 3u);

    EXPECT_EQ(out.data[0].type, cop::cli::OptionType::Flag);
    EXPECT_EQ(out.data[0].value.boolv, 1);

    EXPECT_EQ(out.data[1].id, cop::cli::OptionId::KeysDir);
    EXPECT_STREQ(out.data[1].value.str, "/k");

    EXPECT_EQ(out.data[2].id, cop::cli::OptionId::Db);
    EXPECT_STREQ(out.data[2].value.str, "cop.db");
}

TEST(CliOptions, SupportsEqualsAndAttachedValue) {
    const std::array<cop::cli::OptionSpec, 2> specs = {{
        {cop::cli::OptionId::Section, cop::cli::OptionType::String, "section", 's'},
        {cop::cli::OptionId::At, cop::cli::OptionType::I64, "at", 'a'},
    }};

    const char* argv[] = {"--section=pricing", "-a1700000000"};
    const cop::cli::CliArgs args{argv, 2};

    cop::cli::ParsedOption buf[8]{};
    cop::cli::ParsedOptions out{buf, 0, 8};
    cop::cli::u32 consumed = 0;
    const cop::core::Status s = cop::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, cop::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 2u);
    ASSERT_EQ(out.len, 2u);
    EXPECT_STREQ(out.data[0].value.str, "pricing");
    EXPECT_EQ(out.data[1].value.i64v, 1700000000);
}

TEST(CliOptions, StopsAtDoubleDash) {
    const std::array<cop::cli::OptionSpec, 2> specs = {{
        {cop::cli::OptionId::Db, cop::cli::OptionType::String, "db", 'd'},
        {cop::cli::OptionId::Force, cop::cli::OptionType::Flag, "force", 'f'},
    }};

    const char* argv[] = {"--db", "1", "--", "--force"};
    const cop::cli::CliArgs args{argv, 4};

    cop::cli::ParsedOption buf[8]{};
    cop::cli::ParsedOptions out{buf, 0, 8};
    cop::cli::u32 consumed = 0;
    const cop::core::Status s = cop::cli::parse_options(args, specs.data(), specs.size(), &out, &consumed);
    ASSERT_EQ(s.code, cop::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 3u);
    ASSERT_EQ(out.len, 1u);
    EXPECT_STREQ(out.data[0].value.str, "1");
}

TEST(CliOptions, InvalidOnUnknownOrMissingValue) {
    const std::array<cop::cli::OptionSpec, 2> specs = {{
        {cop::cli::OptionId::Db, cop::cli::OptionType::String, "db", 'd'},
        {cop::cli::OptionId::At, cop::cli::OptionType::I64, "at", '\0'},
    }};

    const char* unknown[] = {"--nope"};
    const char* missing[] = {"--db"};
    const char* not_a_number[] = {"--at", "12x"};
    const char* flag_value[] = {"--db=x", "-q"};
    const struct {
        const char** argv;
        cop::cli::u32 argc;
    } cases[] = {{unknown, 1}, {missing, 1}, {not_a_number, 2}, {flag_value, 2}};

    for (const auto& c : cases) {
        cop::cli::ParsedOption buf[2]{};
        cop::cli::ParsedOptions out{buf, 0, 2};
        cop::cli::u32 consumed = 0;
        const cop::core::Status s =
            cop::cli::parse_options({c.argv, c.argc}, specs.data(), specs.size(), &out, &consumed);
        EXPECT_EQ(s.code, cop::core::StatusCode::Invalid) << c.argv[0];
        EXPECT_EQ(s.domain, cop::core::StatusDomain::Cli);
    }
}

TEST(CliOptions, FlagRejectsInlineValue) {
    const std::array<cop::cli::OptionSpec, 1> specs = {{
        {cop::cli::OptionId::Force, cop::cli::OptionType::Flag, "force", 'f'},
    }};
    const char* argv[] = {"--force=yes"};
    cop::cli::ParsedOption buf[2]{};
    cop::cli::ParsedOptions out{buf, 0, 2};
    cop::cli::u32 consumed = 0;
    EXPECT_EQ(cop::cli::parse_options({argv, 1}, specs.data(), specs.size(), &out, &consumed).code,
        cop::core::StatusCode::Invalid);
}

TEST(CliOptions, OverflowingBufferIsInvalid) {
    const std::array<cop::cli::OptionSpec, 1> specs = {{
        {cop::cli::OptionId::Force, cop::cli::OptionType::Flag, "force", 'f'},
    }};
    const char* argv[] = {"-f", "-f", "-f"};
    cop::cli::ParsedOption buf[2]{};
    cop::cli::ParsedOptions out{buf, 0, 2};
    cop::cli::u32 consumed = 0;
    EXPECT_EQ(cop::cli::parse_options({argv, 3}, specs.data(), specs.size(), &out, &consumed).code,
        cop::core::StatusCode::Invalid);
}

TEST(CliOptions, LastOccurrenceWins) {
    const std::array<cop::cli::OptionSpec, 1> specs = {{
        {cop::cli::OptionId::Section, cop::cli::OptionType::String, "section", 's'},
    }};
    const char* argv[] = {"-s", "a", "--section", "b"};
    cop::cli::ParsedOption buf[4]{};
    cop::cli::ParsedOptions out{buf, 0, 4};
    cop::cli::u32 consumed = 0;
    ASSERT_EQ(cop::cli::parse_options({argv, 4}, specs.data(), specs.size(), &out, &consumed).code,
        cop::core::StatusCode::Ok);
    const cop::cli::ParsedOption* found = cop::cli::find_option(out, cop::cli::OptionId::Section);
    ASSERT_NE(found, nullptr);
    EXPECT_STREQ(found->value.str, "b");
    EXPECT_EQ(cop::cli::find_option(out, cop::cli::OptionId::Db), nullptr);
}
