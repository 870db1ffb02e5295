#include <benchmark/benchmark.h>

#include "mintgate/auth/recover.hpp"
#include "mintgate/crypto/secp256k1.hpp"

static void BM_RecoverSigner(benchmark::State& state) {
    mintgate::crypto::PrivateKey key{};
    key.b[31] = 1;
    mintgate::core::Hash256 digest{};
    digest.b.fill(0x5a);

    mintgate::crypto::Signature sig{};
    if (!mintgate::core::is_ok(mintgate::crypto::ecdsa_sign_recoverable(key, digest, &sig))) {
        state.SkipWithError("signing failed");
        return;
    }

    for (auto _ : state) {
        mintgate::core::Address out{};
        const mintgate::core::Status s = mintgate::auth::recover_signer(digest, sig, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_RecoverSigner);

static void BM_SignRecoverable(benchmark::State& state) {
    mintgate::crypto::PrivateKey key{};
    key.b[31] = 1;
    mintgate::core::Hash256 digest{};
    digest.b.fill(0x5a);

    for (auto _ : state) {
        mintgate::crypto::Signature sig{};
        const mintgate::core::Status s = mintgate::crypto::ecdsa_sign_recoverable(key, digest, &sig);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(sig);
    }
}
BENCHMARK(BM_SignRecoverable);
