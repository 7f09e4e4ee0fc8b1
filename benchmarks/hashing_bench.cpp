#include <array>
#include <cstddef>
#include <string>

#include <benchmark/benchmark.h>

#include "cop/document/canonical.hpp"
#include "cop/document/hashing.hpp"

namespace {
cop::document::Value make_document(std::size_t fields) {
    cop::document::Value doc = cop::document::make_object();
    // Reverse insertion order so the encoder always has to sort.
    for (std::size_t i = fields; i > 0; --i) {
        cop::document::Value line = cop::document::make_object();
        line.set("sku", "item-" + std::to_string(i));
        line.set("qty", static_cast<cop::core::i64>(i));
        line.set("price", 0.25 * static_cast<double>(i));
        doc.set("line_" + std::to_string(i), std::move(line));
    }
    return doc;
}
} // namespace

static void BM_HashCompute(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));

    std::array<cop::core::u8, 4096> buf{};
    for (size_t i = 0; i < buf.size(); ++i){
        buf[i] = static_cast<cop::core::u8>(i & 0xffu);
    }

    for (auto _ : state){
        cop::core::Hash256 out{};
        cop::core::Status s = cop::document::hash_compute({buf.data(), static_cast<cop::core::u32>(n)}, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_HashCompute)->Arg(0)->Arg(3)->Arg(64)->Arg(1024)->Arg(4096);

static void BM_Canonicalize(benchmark::State& state) {
    const cop::document::Value doc = make_document(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        cop::core::Bytes out;
        const cop::core::Status s = cop::document::canonicalize(doc, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out.data());
    }
}
BENCHMARK(BM_Canonicalize)->Arg(1)->Arg(16)->Arg(256);

static void BM_HashDocument(benchmark::State& state) {
    const cop::document::Value doc = make_document(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        cop::core::Hash256 out{};
        const cop::core::Status s = cop::document::hash_document(doc, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HashDocument)->Arg(1)->Arg(16)->Arg(256);

static void BM_ParseJson(benchmark::State& state) {
    cop::core::Bytes text;
    if (!cop::core::is_ok(cop::document::canonicalize(make_document(static_cast<std::size_t>(state.range(0))), &text))) {
        state.SkipWithError("canonicalize failed");
        return;
    }
    for (auto _ : state) {
        cop::document::Value v;
        const cop::core::Status s = cop::document::parse_json(cop::core::view_of(text), &v);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_ParseJson)->Arg(16)->Arg(256);
