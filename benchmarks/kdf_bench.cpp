#include <array>
#include <cstddef>

#include <benchmark/benchmark.h>

#include "cop/security/kdf.hpp"

namespace {
static cop::security::Key256 make_key256_seq(cop::core::u8 start) {
    cop::security::Key256 k{};
    for (size_t i = 0; i < 32; ++i) {
        k.b[i] = static_cast<cop::core::u8>(start + static_cast<cop::core::u8>(i));
    }
    return k;
}
} // namespace

static void BM_KdfExpand(benchmark::State& state) {
    const auto prk = make_key256_seq(7);

    const size_t n = static_cast<size_t>(state.range(0));
    std::array<cop::core::u8, 1024> info_bytes{};
    for (size_t i = 0; i < info_bytes.size(); ++i) {
        info_bytes[i] = static_cast<cop::core::u8>(i & 0xffu);
    }
    const cop::security::BufferView info{info_bytes.data(), static_cast<cop::security::u32>(n)};

    for (auto _ : state) {
        cop::security::Key256 out{};
        const cop::core::Status s = cop::security::hkdf_expand(prk, info, {out.b, sizeof(out.b)});
        benchmark::DoNotOptimize(static_cast<int>(s.code));
        benchmark::DoNotOptimize(out);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_KdfExpand)->Arg(0)->Arg(16)->Arg(64)->Arg(256)->Arg(1024);

static void BM_KdfDerive(benchmark::State& state) {
    const auto secret = make_key256_seq(1);
    std::array<cop::core::u8, 64> binding{};
    for (size_t i = 0; i < binding.size(); ++i) {
        binding[i] = static_cast<cop::core::u8>(i);
    }
    const auto ctx = static_cast<cop::security::KdfContext>(state.range(0));

    for (auto _ : state) {
        cop::security::Key256 out{};
        const cop::core::Status s = cop::security::kdf_derive({secret.b, sizeof(secret.b)}, ctx,
            {binding.data(), static_cast<cop::security::u32>(binding.size())}, &out);
        benchmark::DoNotOptimize(static_cast<int>(s.code));
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_KdfDerive)
    ->Arg(static_cast<int>(cop::security::KdfContext::ContentWrap))
    ->Arg(static_cast<int>(cop::security::KdfContext::ShareWrap));
