#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <stdlib.h>

#include "cop/cli/app.hpp"
#include "cop/core/buffer.hpp"
#include "cop/document/canonical.hpp"
#include "cop/protocol/records.hpp"
#include "cop/store/file_io.hpp"

using cop::core::StatusCode;
using cop::document::Value;

namespace {

class CliAppTest : public ::testing::Test {
protected:
    void SetUp() override {
        char dir_template[] = "/tmp/cop_cli_XXXXXX";
        ASSERT_NE(mkdtemp(dir_template), nullptr);
        root_ = dir_template;
        cfg_.keys_dir = root_ + "/keys";
        cfg_.db_path = root_ + "/db/cop.db";
    }

    void TearDown() override { std::filesystem::remove_all(root_); }

    int run_cop(std::vector<std::string> args) {
        std::vector<const char*> argv;
        for (const std::string& a : args) {
            argv.push_back(a.c_str());
        }
        return cop::cli::run({argv.data(), static_cast<cop::cli::u32>(argv.size())}, cfg_);
    }

    std::string path(const char* name) const { return root_ + "/" + name; }

    void write(const char* name, std::string_view text) {
        ASSERT_EQ(cop::store::write_file(path(name), cop::core::view_of(text), 0644, false).code, StatusCode::Ok);
    }

    Value read_json(const char* name) {
        cop::core::Bytes raw;
        EXPECT_EQ(cop::store::read_file(path(name), &raw).code, StatusCode::Ok);
        Value v;
        EXPECT_EQ(cop::document::parse_json(cop::core::view_of(raw), &v).code, StatusCode::Ok);
        return v;
    }

    void keygen_all() {
        ASSERT_EQ(run_cop({"keygen", "S"}), EXIT_SUCCESS);
        ASSERT_EQ(run_cop({"keygen", "B"}), EXIT_SUCCESS);
        ASSERT_EQ(run_cop({"keygen", "C"}), EXIT_SUCCESS);
    }

    std::string root_;
    cop::cli::CliConfig cfg_;
};

constexpr char kDocument[] = R"({"id": "tx-1", "amount": 100, "currency": "EUR", "item": "widget"})";

} // namespace

TEST_F(CliAppTest, UsageAndArgumentErrors) {
    EXPECT_EQ(run_cop({}), EXIT_FAILURE);
    EXPECT_EQ(run_cop({"--help"}), EXIT_SUCCESS);
    EXPECT_EQ(run_cop({"help"}), EXIT_SUCCESS);
    EXPECT_EQ(run_cop({"frobnicate"}), EXIT_FAILURE);
    EXPECT_EQ(run_cop({"keygen"}), EXIT_FAILURE);
    EXPECT_EQ(run_cop({"keygen", "S", "extra"}), EXIT_FAILURE);
    EXPECT_EQ(run_cop({"--bogus", "help"}), EXIT_FAILURE);
    EXPECT_EQ(run_cop({"keygen", "../S"}), EXIT_FAILURE);
}

TEST_F(CliAppTest, KeygenRefusesOverwriteWithoutForce) {
    ASSERT_EQ(run_cop({"keygen", "S"}), EXIT_SUCCESS);
    EXPECT_EQ(run_cop({"keygen", "S"}), EXIT_FAILURE);
    EXPECT_EQ(run_cop({"keygen", "S", "--force"}), EXIT_SUCCESS);
}

TEST_F(CliAppTest, GlobalOptionsOverrideConfig) {
    const std::string keys = root_ + "/other-keys";
    EXPECT_EQ(run_cop({"--keys-dir", keys, "keygen", "S"}), EXIT_SUCCESS);
    EXPECT_TRUE(std::filesystem::exists(keys + "/S.json"));
}

TEST_F(CliAppTest, ProtectCountersignCheckUnprotect) {
    keygen_all();
    write("doc.json", kDocument);

    ASSERT_EQ(run_cop({"protect", path("doc.json"), "S", "B", path("tx.json"), "--at", "1000"}), EXIT_SUCCESS);
    const Value record = read_json("tx.json");
    EXPECT_EQ(record.find("doc_id")->as_string(), "tx-1");
    EXPECT_EQ(record.find("created_at")->as_int(), 1000);

    // Not yet counter-signed.
    EXPECT_EQ(run_cop({"check", path("tx.json")}), EXIT_FAILURE);

    EXPECT_EQ(run_cop({"countersign", path("tx.json"), "C", "B", path("bad.json")}), EXIT_FAILURE);
    ASSERT_EQ(run_cop({"countersign", path("tx.json"), "S", "B", path("signed.json")}), EXIT_SUCCESS);
    EXPECT_EQ(run_cop({"check", path("signed.json")}), EXIT_SUCCESS);

    ASSERT_EQ(run_cop({"unprotect", path("signed.json"), "B", path("plain.json")}), EXIT_SUCCESS);
    Value original;
    ASSERT_EQ(cop::document::parse_json(cop::core::view_of(std::string_view(kDocument)), &original).code,
        StatusCode::Ok);
    EXPECT_EQ(read_json("plain.json"), original);

    EXPECT_EQ(run_cop({"unprotect", path("signed.json"), "C", path("denied.json")}), EXIT_FAILURE);
    EXPECT_FALSE(std::filesystem::exists(path("denied.json")));
}

TEST_F(CliAppTest, ShareThenAuditorUnprotects) {
    keygen_all();
    write("doc.json", kDocument);
    ASSERT_EQ(run_cop({"protect", path("doc.json"), "S", "B", path("tx.json")}), EXIT_SUCCESS);
    ASSERT_EQ(run_cop({"countersign", path("tx.json"), "S", "B", path("signed.json")}), EXIT_SUCCESS);

    ASSERT_EQ(run_cop({"share", path("signed.json"), "B", "C", path("share.json"), "--at", "2000"}), EXIT_SUCCESS);
    EXPECT_EQ(run_cop({"check", path("signed.json"), "--shares", path("share.json")}), EXIT_SUCCESS);
    EXPECT_EQ(run_cop({"disclosures", "tx-1"}), EXIT_SUCCESS);

    ASSERT_EQ(run_cop({"unprotect", path("signed.json"), "C", path("plain.json"), "--share", path("share.json")}),
        EXIT_SUCCESS);
    EXPECT_EQ(read_json("plain.json").find("amount")->as_int(), 100);

    // Plain records have no sections.
    EXPECT_EQ(run_cop({"share", path("signed.json"), "B", "C", path("s2.json"), "--sections", "pricing"}), EXIT_FAILURE);
}

TEST_F(CliAppTest, TamperedRecordFailsCheck) {
    keygen_all();
    write("doc.json", kDocument);
    ASSERT_EQ(run_cop({"protect", path("doc.json"), "S", "B", path("tx.json")}), EXIT_SUCCESS);
    ASSERT_EQ(run_cop({"countersign", path("tx.json"), "S", "B", path("signed.json")}), EXIT_SUCCESS);

    cop::protocol::ProtectedTransaction tx{};
    ASSERT_EQ(cop::protocol::from_value(read_json("signed.json"), &tx).code, StatusCode::Ok);
    tx.content_hash.b[0] ^= 0x01u;
    cop::core::Bytes bytes;
    ASSERT_EQ(cop::protocol::encode_record(tx, &bytes).code, StatusCode::Ok);
    ASSERT_EQ(cop::store::write_file(path("forged.json"), cop::core::view_of(bytes), 0644, false).code, StatusCode::Ok);

    EXPECT_EQ(run_cop({"check", path("forged.json")}), EXIT_FAILURE);
    EXPECT_EQ(run_cop({"unprotect", path("forged.json"), "B", path("out.json")}), EXIT_FAILURE);
}

TEST_F(CliAppTest, LayeredFlow) {
    keygen_all();
    write("doc.json", kDocument);
    write("plan.json", R"({"sections": {"pricing": ["amount", "currency"]}, "remainder": "general"})");

    ASSERT_EQ(run_cop({"protect", path("doc.json"), "S", "B", path("tx.json"), "--layers", path("plan.json")}),
        EXIT_SUCCESS);
    EXPECT_EQ(read_json("tx.json").find("kind")->as_string(), "layered");
    ASSERT_EQ(run_cop({"countersign", path("tx.json"), "S", "B", path("signed.json")}), EXIT_SUCCESS);
    EXPECT_EQ(run_cop({"check", path("signed.json")}), EXIT_SUCCESS);

    ASSERT_EQ(run_cop({"unprotect", path("signed.json"), "B", path("all.json")}), EXIT_SUCCESS);
    const Value all = read_json("all.json");
    EXPECT_EQ(all.find("item")->as_string(), "widget");
    EXPECT_EQ(all.find("amount")->as_int(), 100);

    ASSERT_EQ(run_cop({"share", path("signed.json"), "B", "C", path("share.json"), "--sections", "pricing"}),
        EXIT_SUCCESS);
    EXPECT_EQ(run_cop({"check", path("signed.json"), "-s", path("share.json")}), EXIT_SUCCESS);
    EXPECT_EQ(run_cop({"disclosures", "tx-1", "--section", "pricing"}), EXIT_SUCCESS);

    ASSERT_EQ(run_cop({"unprotect", path("signed.json"), "C", path("pricing.json"), "--share", path("share.json"),
                  "--section", "pricing"}),
        EXIT_SUCCESS);
    const Value pricing = read_json("pricing.json");
    EXPECT_EQ(pricing.find("currency")->as_string(), "EUR");
    EXPECT_EQ(pricing.find("item"), nullptr);

    EXPECT_EQ(run_cop({"unprotect", path("signed.json"), "C", path("general.json"), "--share", path("share.json"),
                  "--section", "general"}),
        EXIT_FAILURE);

    // Without --section the auditor gets only what it may open.
    ASSERT_EQ(run_cop({"unprotect", path("signed.json"), "C", path("partial.json"), "--share", path("share.json")}),
        EXIT_SUCCESS);
    const Value partial = read_json("partial.json");
    EXPECT_NE(partial.find("amount"), nullptr);
    EXPECT_EQ(partial.find("item"), nullptr);
}

TEST_F(CliAppTest, MissingKeysFail) {
    write("doc.json", kDocument);
    EXPECT_EQ(run_cop({"protect", path("doc.json"), "S", "B", path("tx.json")}), EXIT_FAILURE);
    EXPECT_FALSE(std::filesystem::exists(path("tx.json")));
}
