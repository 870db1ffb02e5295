#include <array>
#include <cstddef>

#include <benchmark/benchmark.h>

#include "mintgate/crypto/keccak.hpp"

static void BM_Keccak256(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));

    std::array<mintgate::crypto::u8, 4096> buf{};
    for (size_t i = 0; i < buf.size(); ++i){
        buf[i] = static_cast<mintgate::crypto::u8>(i & 0xffu);
    }

    for (auto _ : state){
        mintgate::core::Hash256 out{};
        mintgate::core::Status s = mintgate::crypto::keccak256({buf.data(), static_cast<mintgate::crypto::u32>(n)}, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_Keccak256)->Arg(0)->Arg(32)->Arg(136)->Arg(1024)->Arg(4096);
