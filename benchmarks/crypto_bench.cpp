#include <cstddef>
#include <vector>

#include <benchmark/benchmark.h>

#include "cop/security/asymmetric.hpp"
#include "cop/security/crypto.hpp"

namespace {
static cop::security::Key256 make_key256_seq(cop::core::u8 start) {
    cop::security::Key256 k{};
    for (size_t i = 0; i < 32; ++i) {
        k.b[i] = static_cast<cop::core::u8>(start + static_cast<cop::core::u8>(i));
    }
    return k;
}

static cop::security::Nonce12 make_nonce12_seq(cop::core::u8 start) {
    cop::security::Nonce12 n{};
    for (size_t i = 0; i < 12; ++i) {
        n.b[i] = static_cast<cop::core::u8>(start + static_cast<cop::core::u8>(i));
    }
    return n;
}
} // namespace

static void BM_AeadSeal(benchmark::State& state) {
    const auto key = make_key256_seq(1);
    const auto nonce = make_nonce12_seq(9);
    const size_t n = static_cast<size_t>(state.range(0));
    std::vector<cop::core::u8> pt(n, 0x5a);
    std::vector<cop::core::u8> ct(n);
    const cop::core::u8 aad[] = {'d', 'o', 'c'};

    for (auto _ : state) {
        cop::security::Tag16 tag{};
        const cop::core::Status s = cop::security::aead_seal(cop::security::AeadId::ChaCha20Poly1305, key, nonce,
            {aad, sizeof(aad)}, {pt.data(), static_cast<cop::core::u32>(n)}, {ct.data(), static_cast<cop::core::u32>(n)},
            &tag);
        benchmark::DoNotOptimize(static_cast<int>(s.code));
        benchmark::DoNotOptimize(tag);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_AeadSeal)->Arg(64)->Arg(1024)->Arg(16384);

static void BM_AeadOpen(benchmark::State& state) {
    const auto key = make_key256_seq(1);
    const auto nonce = make_nonce12_seq(9);
    const size_t n = static_cast<size_t>(state.range(0));
    std::vector<cop::core::u8> pt(n, 0x5a);
    std::vector<cop::core::u8> ct(n);
    cop::security::Tag16 tag{};
    if (!cop::core::is_ok(cop::security::aead_seal(cop::security::AeadId::ChaCha20Poly1305, key, nonce, {nullptr, 0},
            {pt.data(), static_cast<cop::core::u32>(n)}, {ct.data(), static_cast<cop::core::u32>(n)}, &tag))) {
        state.SkipWithError("seal failed");
        return;
    }

    for (auto _ : state) {
        const cop::core::Status s = cop::security::aead_open(cop::security::AeadId::ChaCha20Poly1305, key, nonce,
            {nullptr, 0}, {ct.data(), static_cast<cop::core::u32>(n)}, tag, {pt.data(), static_cast<cop::core::u32>(n)});
        benchmark::DoNotOptimize(static_cast<int>(s.code));
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_AeadOpen)->Arg(64)->Arg(1024)->Arg(16384);

static void BM_X25519Shared(benchmark::State& state) {
    cop::security::EncKeyPair a{};
    cop::security::EncKeyPair b{};
    if (!cop::core::is_ok(cop::security::enc_keypair_generate(&a)) ||
        !cop::core::is_ok(cop::security::enc_keypair_generate(&b))) {
        state.SkipWithError("keygen failed");
        return;
    }
    for (auto _ : state) {
        cop::security::SharedSecret out{};
        const cop::core::Status s = cop::security::derive_shared_secret(a.priv, b.pub, &out);
        benchmark::DoNotOptimize(static_cast<int>(s.code));
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_X25519Shared);

static void BM_Ed25519SignVerify(benchmark::State& state) {
    cop::security::SigningKeyPair kp{};
    if (!cop::core::is_ok(cop::security::signing_keypair_generate(&kp))) {
        state.SkipWithError("keygen failed");
        return;
    }
    cop::core::Hash256 h{};
    for (size_t i = 0; i < h.b.size(); ++i) {
        h.b[i] = static_cast<cop::core::u8>(i);
    }
    for (auto _ : state) {
        cop::security::Signature sig{};
        cop::core::Status s = cop::security::sign_hash(kp.priv, h, &sig);
        if (cop::core::is_ok(s)) {
            s = cop::security::verify_hash(kp.pub, h, sig);
        }
        benchmark::DoNotOptimize(static_cast<int>(s.code));
    }
}
BENCHMARK(BM_Ed25519SignVerify);
