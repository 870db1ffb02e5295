#pragma once

#include <type_traits>

#include "mintgate/cli/options.hpp"
#include "mintgate/core/errors.hpp"

namespace mintgate::cli {
    using u32 = mintgate::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help,
        As,
        Grant,
        Features,
        Token,
        Hardcap,
        Mint,
        MintAuth,
        Cancel,
        CancelSelf,
        Nonce,
        Digest,
        Status,
        Events,
        Quit,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against `specs` by exact name. On success out->args
    // holds everything after the command word.
    [[nodiscard]] mintgate::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace mintgate::cli
