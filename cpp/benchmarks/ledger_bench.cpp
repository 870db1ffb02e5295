#include <benchmark/benchmark.h>

#include "mintgate/core/events.hpp"
#include "mintgate/ledger/nonce_ledger.hpp"

namespace {

class NullSink final : public mintgate::core::EventSink {
public:
    void emit(const mintgate::core::Event&) noexcept override {}
};

} // namespace

static void BM_LedgerUse(benchmark::State& state) {
    NullSink sink;
    mintgate::ledger::NonceLedger ledger(sink);
    mintgate::core::Address authorizer{};
    authorizer.b.fill(0x42);

    mintgate::core::u64 i = 0;
    for (auto _ : state) {
        mintgate::core::Nonce n{};
        for (size_t b = 0; b < 8; ++b) {
            n.b[31 - b] = static_cast<mintgate::core::u8>((i >> (8 * b)) & 0xffu);
        }
        ++i;
        const mintgate::core::Status s = ledger.use_or_cancel(authorizer, n, false);
        benchmark::DoNotOptimize(s);
    }
    state.counters["entries"] = static_cast<double>(ledger.consumed_count());
}
BENCHMARK(BM_LedgerUse);

static void BM_LedgerQuery(benchmark::State& state) {
    NullSink sink;
    mintgate::ledger::NonceLedger ledger(sink);
    mintgate::core::Address authorizer{};
    authorizer.b.fill(0x42);

    const auto entries = static_cast<mintgate::core::u64>(state.range(0));
    for (mintgate::core::u64 i = 0; i < entries; ++i) {
        mintgate::core::Nonce n{};
        for (size_t b = 0; b < 8; ++b) {
            n.b[31 - b] = static_cast<mintgate::core::u8>((i >> (8 * b)) & 0xffu);
        }
        (void)ledger.use_or_cancel(authorizer, n, false);
    }

    mintgate::core::Nonce probe{};
    probe.b.fill(0xff);
    for (auto _ : state) {
        const bool used = ledger.query_state(authorizer, probe);
        benchmark::DoNotOptimize(used);
    }
}
BENCHMARK(BM_LedgerQuery)->Arg(16)->Arg(1024)->Arg(65536);
