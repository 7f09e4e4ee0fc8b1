#include <map>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "cop/identity/registry.hpp"
#include "cop/identity/vault.hpp"
#include "cop/protocol/layered.hpp"
#include "cop/security/asymmetric.hpp"

using namespace cop::protocol;
using cop::core::StatusCode;
using cop::core::StatusDomain;
using cop::document::Value;
using cop::identity::PartySecrets;

namespace {

LayerPlan pricing_plan() {
    LayerPlan plan;
    plan.sections["pricing"] = {"amount", "currency"};
    plan.sections["parties"] = {"buyer", "seller"};
    plan.remainder_section = "general";
    return plan;
}

Value sample_document() {
    Value doc = cop::document::make_object();
    doc.set("id", "tx-1");
    doc.set("amount", 100);
    doc.set("currency", "EUR");
    doc.set("buyer", "B");
    doc.set("seller", "S");
    doc.set("item", "widget");
    return doc;
}

class LayeredTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_EQ(cop::identity::generate_party("S", &seller_).code, StatusCode::Ok);
        ASSERT_EQ(cop::identity::generate_party("B", &buyer_).code, StatusCode::Ok);
        ASSERT_EQ(cop::identity::generate_party("C", &auditor_).code, StatusCode::Ok);
        ASSERT_EQ(cop::identity::generate_party("D", &outsider_).code, StatusCode::Ok);
        for (const PartySecrets* p : {&seller_, &buyer_, &auditor_, &outsider_}) {
            ASSERT_EQ(registry_.put(cop::identity::public_keys_of(*p)).code, StatusCode::Ok);
        }
        doc_ = sample_document();
        ASSERT_EQ(protect_with_layers(doc_, pricing_plan(), "S", seller_.signing.priv, seller_.encryption.priv, "B",
                      buyer_.encryption.pub, 1000, &tx_)
                      .code,
            StatusCode::Ok);
    }

    void TearDown() override {
        cop::identity::scrub(&seller_);
        cop::identity::scrub(&buyer_);
        cop::identity::scrub(&auditor_);
        cop::identity::scrub(&outsider_);
    }

    std::vector<ShareRecord> share_sections(const std::vector<std::string>& names) {
        std::vector<ShareRecord> out;
        EXPECT_EQ(create_layer_share_records(tx_, "B", buyer_.encryption.priv, buyer_.signing.priv, "C",
                      auditor_.encryption.pub, names, nullptr, nullptr, 2000, &out)
                      .code,
            StatusCode::Ok);
        return out;
    }

    PartySecrets seller_{};
    PartySecrets buyer_{};
    PartySecrets auditor_{};
    PartySecrets outsider_{};
    cop::identity::MemoryRegistry registry_;
    Value doc_;
    LayeredProtectedTransaction tx_{};
};

} // namespace

TEST(ProtocolSplit, AssignsFieldsAndRemainder) {
    std::map<std::string, Value, std::less<>> parts;
    ASSERT_EQ(split_document(sample_document(), pricing_plan(), &parts).code, StatusCode::Ok);
    ASSERT_EQ(parts.size(), 3u);

    Value pricing = cop::document::make_object();
    pricing.set("amount", 100);
    pricing.set("currency", "EUR");
    EXPECT_EQ(parts["pricing"], pricing);

    Value general = cop::document::make_object();
    general.set("id", "tx-1");
    general.set("item", "widget");
    EXPECT_EQ(parts["general"], general);
}

TEST(ProtocolSplit, RemainderMayJoinNamedSection) {
    LayerPlan plan;
    plan.sections["pricing"] = {"amount"};
    plan.remainder_section = "pricing";
    std::map<std::string, Value, std::less<>> parts;
    ASSERT_EQ(split_document(sample_document(), plan, &parts).code, StatusCode::Ok);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts["pricing"].as_object().size(), 6u);
}

TEST(ProtocolSplit, RejectsBadPlans) {
    std::map<std::string, Value, std::less<>> parts;

    LayerPlan overlap;
    overlap.sections["a"] = {"amount"};
    overlap.sections["b"] = {"amount"};
    overlap.remainder_section = "rest";
    const cop::core::Status s = split_document(sample_document(), overlap, &parts);
    EXPECT_EQ(s.code, StatusCode::Structural);
    EXPECT_EQ(s.domain, StatusDomain::Document);

    LayerPlan missing;
    missing.sections["a"] = {"nope"};
    missing.remainder_section = "rest";
    EXPECT_EQ(split_document(sample_document(), missing, &parts).code, StatusCode::Structural);

    LayerPlan no_remainder;
    no_remainder.sections["a"] = {"amount"};
    EXPECT_EQ(split_document(sample_document(), no_remainder, &parts).code, StatusCode::Structural);

    EXPECT_EQ(split_document(sample_document(), LayerPlan{}, &parts).code, StatusCode::Invalid);

    LayerPlan empty_fields;
    empty_fields.sections["a"] = {};
    EXPECT_EQ(split_document(sample_document(), empty_fields, &parts).code, StatusCode::Invalid);

    EXPECT_EQ(split_document(Value("x"), pricing_plan(), &parts).code, StatusCode::Structural);
}

TEST_F(LayeredTest, ProtectBuildsOneEnvelopePerSection) {
    EXPECT_EQ(tx_.doc_id, "tx-1");
    ASSERT_EQ(tx_.sections.size(), 3u);
    for (const auto& entry : tx_.sections) {
        EXPECT_EQ(entry.second.key_wraps.size(), 2u);
        EXPECT_FALSE(entry.second.ciphertext.empty());
    }
    cop::core::Hash256 h{};
    ASSERT_EQ(compute_aggregate_hash(tx_.doc_id, tx_.sections, &h).code, StatusCode::Ok);
    EXPECT_EQ(h, tx_.aggregate_hash);
}

TEST_F(LayeredTest, SectionKeysAreIndependent) {
    const auto& a = tx_.sections.at("pricing").key_wraps.at("B");
    const auto& b = tx_.sections.at("parties").key_wraps.at("B");
    EXPECT_FALSE(entry_equal(a, b));
}

TEST_F(LayeredTest, BuyerOpensEachSection) {
    Value out;
    ASSERT_EQ(unprotect_layer(tx_, "B", "pricing", buyer_.encryption.priv, nullptr, nullptr, &out).code, StatusCode::Ok);
    EXPECT_EQ(out.find("amount")->as_int(), 100);
    EXPECT_EQ(out.find("item"), nullptr);

    ASSERT_EQ(unprotect_layer(tx_, "S", "general", seller_.encryption.priv, nullptr, nullptr, &out).code, StatusCode::Ok);
    EXPECT_EQ(out.find("item")->as_string(), "widget");
}

TEST_F(LayeredTest, UnknownSectionIsNotFound) {
    Value out;
    EXPECT_EQ(unprotect_layer(tx_, "B", "shipping", buyer_.encryption.priv, nullptr, nullptr, &out).code,
        StatusCode::NotFound);
}

TEST_F(LayeredTest, CounterSignAndVerify) {
    LayeredProtectedTransaction signed_tx{};
    ASSERT_EQ(counter_sign_layered(tx_, "B", buyer_.signing.priv, buyer_.encryption.priv, seller_.signing.pub,
                  &signed_tx)
                  .code,
        StatusCode::Ok);
    ASSERT_TRUE(signed_tx.sig_buyer.has_value());

    VerifyReport report{};
    ASSERT_EQ(verify_layered(signed_tx, registry_, nullptr, &report).code, StatusCode::Ok);
    EXPECT_TRUE(report.aggregate_ok);
    EXPECT_TRUE(report.seller_ok);
    EXPECT_TRUE(report.buyer_present);
    EXPECT_TRUE(report.buyer_ok);

    LayeredProtectedTransaction again{};
    EXPECT_EQ(counter_sign_layered(signed_tx, "B", buyer_.signing.priv, buyer_.encryption.priv, seller_.signing.pub,
                  &again)
                  .code,
        StatusCode::Conflict);
    EXPECT_EQ(counter_sign_layered(tx_, "S", seller_.signing.priv, seller_.encryption.priv, seller_.signing.pub,
                  &again)
                  .code,
        StatusCode::AccessDenied);
    EXPECT_EQ(counter_sign_layered(tx_, "B", buyer_.signing.priv, buyer_.encryption.priv, auditor_.signing.pub,
                  &again)
                  .code,
        StatusCode::SignatureInvalid);
}

TEST_F(LayeredTest, DroppedSectionBreaksAggregate) {
    LayeredProtectedTransaction cut = tx_;
    cut.sections.erase("parties");

    VerifyReport report{};
    ASSERT_EQ(verify_layered(cut, registry_, nullptr, &report).code, StatusCode::Ok);
    EXPECT_FALSE(report.aggregate_ok);

    Value out;
    EXPECT_EQ(unprotect_layer(cut, "B", "pricing", buyer_.encryption.priv, nullptr, nullptr, &out).code,
        StatusCode::HashMismatch);

    LayeredProtectedTransaction signed_tx{};
    EXPECT_EQ(counter_sign_layered(cut, "B", buyer_.signing.priv, buyer_.encryption.priv, seller_.signing.pub,
                  &signed_tx)
                  .code,
        StatusCode::HashMismatch);
}

TEST_F(LayeredTest, SwappedSectionCiphertextFails) {
    LayeredProtectedTransaction swapped = tx_;
    std::swap(swapped.sections.at("pricing").ciphertext, swapped.sections.at("general").ciphertext);
    Value out;
    EXPECT_NE(unprotect_layer(swapped, "B", "pricing", buyer_.encryption.priv, nullptr, nullptr, &out).code,
        StatusCode::Ok);
}

TEST_F(LayeredTest, SectionShareIsScoped) {
    const std::vector<ShareRecord> shares = share_sections({"pricing"});
    ASSERT_EQ(shares.size(), 1u);
    const ShareRecord& r = shares[0];
    ASSERT_TRUE(r.section.has_value());
    EXPECT_EQ(*r.section, "pricing");
    ASSERT_TRUE(r.layer_hash.has_value());
    EXPECT_EQ(*r.layer_hash, tx_.sections.at("pricing").content_hash);

    Value out;
    ASSERT_EQ(unprotect_layer(tx_, "C", "pricing", auditor_.encryption.priv, &r, &registry_, &out).code,
        StatusCode::Ok);
    EXPECT_EQ(out.find("currency")->as_string(), "EUR");

    EXPECT_EQ(unprotect_layer(tx_, "C", "parties", auditor_.encryption.priv, &r, &registry_, &out).code,
        StatusCode::AccessDenied);
}

TEST_F(LayeredTest, SharingIsAllOrNothing) {
    std::vector<ShareRecord> out;
    const std::vector<std::string> with_unknown{"pricing", "shipping"};
    EXPECT_EQ(create_layer_share_records(tx_, "B", buyer_.encryption.priv, buyer_.signing.priv, "C",
                  auditor_.encryption.pub, with_unknown, nullptr, nullptr, 0, &out)
                  .code,
        StatusCode::NotFound);
    EXPECT_TRUE(out.empty());

    const std::vector<std::string> duplicate{"pricing", "pricing"};
    EXPECT_EQ(create_layer_share_records(tx_, "B", buyer_.encryption.priv, buyer_.signing.priv, "C",
                  auditor_.encryption.pub, duplicate, nullptr, nullptr, 0, &out)
                  .code,
        StatusCode::Invalid);

    const std::vector<std::string> none;
    EXPECT_EQ(create_layer_share_records(tx_, "B", buyer_.encryption.priv, buyer_.signing.priv, "C",
                  auditor_.encryption.pub, none, nullptr, nullptr, 0, &out)
                  .code,
        StatusCode::Invalid);
}

TEST_F(LayeredTest, ReshareSectionViaInboundShare) {
    const std::vector<ShareRecord> to_c = share_sections({"pricing", "general"});
    ASSERT_EQ(to_c.size(), 2u);

    std::vector<ShareRecord> to_d;
    ASSERT_EQ(create_layer_share_records(tx_, "C", auditor_.encryption.priv, auditor_.signing.priv, "D",
                  outsider_.encryption.pub, {"general"}, &to_c, &registry_, 3000, &to_d)
                  .code,
        StatusCode::Ok);
    ASSERT_EQ(to_d.size(), 1u);

    Value out;
    ASSERT_EQ(unprotect_layer(tx_, "D", "general", outsider_.encryption.priv, &to_d[0], &registry_, &out).code,
        StatusCode::Ok);
    EXPECT_EQ(out.find("id")->as_string(), "tx-1");

    std::vector<ShareRecord> denied;
    EXPECT_EQ(create_layer_share_records(tx_, "C", auditor_.encryption.priv, auditor_.signing.priv, "D",
                  outsider_.encryption.pub, {"parties"}, &to_c, &registry_, 3000, &denied)
                  .code,
        StatusCode::AccessDenied);
}

TEST_F(LayeredTest, VerifyReportsSectionShares) {
    std::vector<ShareRecord> shares = share_sections({"pricing"});
    ShareRecord stale = shares[0];
    stale.layer_hash = tx_.sections.at("parties").content_hash;
    shares.push_back(stale);
    ShareRecord whole = shares[0];
    whole.section.reset();
    shares.push_back(whole);

    VerifyReport report{};
    ASSERT_EQ(verify_layered(tx_, registry_, &shares, &report).code, StatusCode::Ok);
    ASSERT_EQ(report.shares.size(), 3u);
    EXPECT_TRUE(report.shares[0].valid);
    ASSERT_TRUE(report.shares[0].layer_hash_ok.has_value());
    EXPECT_TRUE(*report.shares[0].layer_hash_ok);

    // The signature covers layer_hash, so the rewritten copy fails both checks.
    EXPECT_FALSE(report.shares[1].valid);
    ASSERT_TRUE(report.shares[1].layer_hash_ok.has_value());
    EXPECT_FALSE(*report.shares[1].layer_hash_ok);

    EXPECT_FALSE(report.shares[2].valid);
    EXPECT_FALSE(report.shares[2].layer_hash_ok.has_value());
}

TEST_F(LayeredTest, ProtectNeedsCanonicalDocument) {
    Value doc = sample_document();
    doc.set("blob", cop::document::BinaryBlob{{1, 2, 3}});
    LayeredProtectedTransaction out{};
    EXPECT_EQ(protect_with_layers(doc, pricing_plan(), "S", seller_.signing.priv, seller_.encryption.priv, "B",
                  buyer_.encryption.pub, 0, &out)
                  .code,
        StatusCode::Structural);
}

TEST_F(LayeredTest, CounterSignRejectsSellerSignatureOverAnotherAggregate) {
    // Same document, fresh keys and wraps: a different aggregate.
    LayeredProtectedTransaction other{};
    ASSERT_EQ(protect_with_layers(doc_, pricing_plan(), "S", seller_.signing.priv, seller_.encryption.priv, "B",
                  buyer_.encryption.pub, 1000, &other)
                  .code,
        StatusCode::Ok);

    LayeredProtectedTransaction forged = tx_;
    ASSERT_EQ(cop::security::sign_hash(seller_.signing.priv, other.aggregate_hash, &forged.sig_seller).code,
        StatusCode::Ok);

    LayeredProtectedTransaction out{};
    EXPECT_EQ(counter_sign_layered(forged, "B", buyer_.signing.priv, buyer_.encryption.priv, seller_.signing.pub,
                  &out)
                  .code,
        StatusCode::SignatureInvalid);
    EXPECT_FALSE(out.sig_buyer.has_value());

    VerifyReport report{};
    ASSERT_EQ(verify_layered(forged, registry_, nullptr, &report).code, StatusCode::Ok);
    EXPECT_TRUE(report.aggregate_ok);
    EXPECT_FALSE(report.seller_ok);
}

TEST_F(LayeredTest, ReshareSkipsViasForOtherDocumentsOrHolders) {
    Value other_doc = cop::document::make_object();
    other_doc.set("id", "tx-2");
    other_doc.set("amount", 7);
    other_doc.set("currency", "USD");
    other_doc.set("buyer", "B");
    other_doc.set("seller", "S");
    other_doc.set("item", "bolt");
    LayeredProtectedTransaction other{};
    ASSERT_EQ(protect_with_layers(other_doc, pricing_plan(), "S", seller_.signing.priv, seller_.encryption.priv, "B",
                  buyer_.encryption.pub, 1000, &other)
                  .code,
        StatusCode::Ok);

    std::vector<ShareRecord> other_to_c;
    ASSERT_EQ(create_layer_share_records(other, "B", buyer_.encryption.priv, buyer_.signing.priv, "C",
                  auditor_.encryption.pub, {"general"}, nullptr, nullptr, 2000, &other_to_c)
                  .code,
        StatusCode::Ok);
    std::vector<ShareRecord> to_d;
    ASSERT_EQ(create_layer_share_records(tx_, "B", buyer_.encryption.priv, buyer_.signing.priv, "D",
                  outsider_.encryption.pub, {"general"}, nullptr, nullptr, 2000, &to_d)
                  .code,
        StatusCode::Ok);
    const std::vector<ShareRecord> to_c = share_sections({"general"});

    // Stale entries first: same section, wrong document or wrong holder.
    const std::vector<ShareRecord> vias = {other_to_c[0], to_d[0], to_c[0]};
    std::vector<ShareRecord> reshared;
    ASSERT_EQ(create_layer_share_records(tx_, "C", auditor_.encryption.priv, auditor_.signing.priv, "D",
                  outsider_.encryption.pub, {"general"}, &vias, &registry_, 3000, &reshared)
                  .code,
        StatusCode::Ok);
    ASSERT_EQ(reshared.size(), 1u);

    Value out;
    EXPECT_EQ(unprotect_layer(tx_, "D", "general", outsider_.encryption.priv, &reshared[0], &registry_, &out).code,
        StatusCode::Ok);
}
