#include <array>

#include <benchmark/benchmark.h>

#include "mintgate/cli/commands.hpp"
#include "mintgate/cli/options.hpp"

static void BM_CliParseOptions(benchmark::State& state) {
    const std::array<mintgate::cli::OptionSpec, 4> specs = {{
        {mintgate::cli::OptionId::From, mintgate::cli::OptionType::String, "from", 'f'},
        {mintgate::cli::OptionId::At, mintgate::cli::OptionType::U64, "at", 't'},
        {mintgate::cli::OptionId::Chain, mintgate::cli::OptionType::U64, "chain", 'c'},
        {mintgate::cli::OptionId::Key, mintgate::cli::OptionType::String, "key", 'k'},
    }};

    const char* argv[] = {"--from", "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf", "--at=1700000000", "-c5", "--", "0x11"};
    const mintgate::cli::CliArgs args{argv, 6};
    for (auto _ : state) {
        mintgate::cli::ParsedOption buf[8]{};
        mintgate::cli::ParsedOptions out{buf, 0, 8};
        mintgate::cli::u32 consumed = 0;
        const mintgate::core::Status s = mintgate::cli::parse_options(args, specs.data(),
            static_cast<mintgate::cli::u32>(specs.size()), &out, &consumed);
        benchmark::DoNotOptimize(static_cast<mintgate::core::u16>(s.code));
        benchmark::DoNotOptimize(out.len);
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseOptions);

static void BM_CliParseCommand(benchmark::State& state) {
    const std::array<mintgate::cli::CommandSpec, 5> specs = {{
        {mintgate::cli::CommandId::Help, "help"},
        {mintgate::cli::CommandId::Mint, "mint"},
        {mintgate::cli::CommandId::MintAuth, "mint-auth"},
        {mintgate::cli::CommandId::Cancel, "cancel"},
        {mintgate::cli::CommandId::Nonce, "nonce"},
    }};

    const char* argv[] = {"nonce", "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf", "0x01"};
    const mintgate::cli::CliArgs args{argv, 3};
    for (auto _ : state) {
        mintgate::cli::CommandInvocation out{};
        mintgate::cli::u32 consumed = 0;
        const mintgate::core::Status s = mintgate::cli::parse_command(args, specs.data(),
            static_cast<mintgate::cli::u32>(specs.size()), &out, &consumed);
        benchmark::DoNotOptimize(static_cast<mintgate::core::u16>(s.code));
        benchmark::DoNotOptimize(static_cast<mintgate::cli::u32>(out.id));
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseCommand);
