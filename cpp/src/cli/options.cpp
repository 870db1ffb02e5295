#include "mintgate/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace mintgate::cli {
    using mintgate::core::Status;
    using mintgate::core::StatusCode;
    using mintgate::core::StatusDomain;

    namespace {
        [[nodiscard]] constexpr Status invalid(u32 aux = 0) noexcept {
            return mintgate::core::make_status(StatusDomain::Cli, StatusCode::Invalid, aux);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count,
            const char* name, size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_u64(const char* s, u64* out) noexcept {
            if (s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            u64 v{};
            const auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        // Fills opt.value from `text` according to the declared option type.
        [[nodiscard]] Status assign_value(const OptionSpec& spec, const char* text, ParsedOption* opt) noexcept {
            switch (spec.type) {
                case OptionType::String:
                    opt->value.str = text;
                    return mintgate::core::ok_status();
                case OptionType::U64: {
                    u64 v{};
                    if (!parse_u64(text, &v)) {
                        return invalid();
                    }
                    opt->value.u64v = v;
                    return mintgate::core::ok_status();
                }
                case OptionType::Flag:
                    break;
            }
            return invalid();
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = opt;
            return mintgate::core::ok_status();
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const size_t name_len = eq ? static_cast<size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return invalid();
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    inline_value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return invalid();
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;

            if (spec->type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return invalid();
                }
                opt.value.boolv = 1;
                ++i;
            } else {
                const char* value = inline_value;
                if (value == nullptr) {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return invalid();
                    }
                    value = args.argv[i + 1];
                    i += 2;
                } else {
                    ++i;
                }
                const Status s = assign_value(*spec, value, &opt);
                if (!mintgate::core::is_ok(s)) {
                    return s;
                }
            }

            const Status s = push_option(out, opt);
            if (!mintgate::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return mintgate::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace mintgate::cli
