#include "mintgate/cli/commands.hpp"

#include <cstring>

namespace mintgate::cli {
    mintgate::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        using mintgate::core::StatusCode;
        using mintgate::core::StatusDomain;

        if (out == nullptr || consumed == nullptr) {
            return mintgate::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return mintgate::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return mintgate::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* word = args.argv[0];
        if (word[0] == '-') {
            return mintgate::core::make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, word) == 0) {
                out->id = specs[i].id;
                out->args = CliArgs{args.argv + 1, args.argc - 1};
                *consumed = 1;
                return mintgate::core::ok_status();
            }
        }
        return mintgate::core::make_status(StatusDomain::Cli, StatusCode::NotFound);
    }
} // namespace mintgate::cli
