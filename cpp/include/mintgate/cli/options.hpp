#pragma once

#include <type_traits>

#include "mintgate/core/errors.hpp"
#include "mintgate/core/types.hpp"

namespace mintgate::cli {
    using u8 = mintgate::core::u8;
    using u32 = mintgate::core::u32;
    using u64 = mintgate::core::u64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        U64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        From = 1,    // sender address for this invocation
        At = 2,      // block timestamp, unix seconds
        Chain = 3,   // chain id
        Key = 4,     // hex private key used to sign locally
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        u64 u64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options ("--name value", "--name=value", "-x value",
    // "-xvalue") and stops at the first positional or after "--".
    // consumed receives the number of argv entries used.
    [[nodiscard]] mintgate::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence wins; nullptr if the option is absent.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace mintgate::cli
