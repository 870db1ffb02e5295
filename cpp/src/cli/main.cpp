#include <charconv>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "mintgate/access/access_registry.hpp"
#include "mintgate/cli/commands.hpp"
#include "mintgate/cli/options.hpp"
#include "mintgate/core/errors.hpp"
#include "mintgate/core/hex.hpp"
#include "mintgate/crypto/secp256k1.hpp"
#include "mintgate/db/journal.hpp"
#include "mintgate/eip712/digest.hpp"
#include "mintgate/gateway/gateway.hpp"
#include "mintgate/token/token_registry.hpp"

// ========================================================================
// Global State
// ========================================================================

volatile sig_atomic_t g_running = 1;

// ========================================================================
// Configuration
// ========================================================================

// Address of private key 1; a throwaway owner for local sessions.
constexpr const char* kDevOwner = "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf";
constexpr const char* kDevContract = "0x000000000000000000000000000000000000c0de";

struct CliConfig {
    std::string db_path;
    std::string domain_name{mintgate::gateway::kDefaultDomainName};
    mintgate::core::u64 chain_id{1};
    mintgate::core::u64 hardcap{mintgate::gateway::kDefaultHardcap};
    mintgate::core::Address contract{};
    mintgate::core::Address owner{};
};

struct Session {
    mintgate::gateway::MintGateway* gateway{nullptr};
    mintgate::access::AccessRegistry* access{nullptr};
    mintgate::token::TokenRegistry* tokens{nullptr};
    mintgate::db::EventJournal* journal{nullptr};
    mintgate::core::Address contract{};
    mintgate::core::Address sender{};
    mintgate::core::u64 chain_id{1};
    // Per-collection access lists; the registry keeps pointers into them.
    std::map<mintgate::core::Address, std::unique_ptr<mintgate::access::AccessRegistry>> collection_access;
};

// Arguments of one command after option extraction.
struct Invocation {
    std::vector<const char*> positional;
    mintgate::core::ExecContext ctx{};
    const char* key{nullptr};
};

static const mintgate::cli::OptionSpec g_options[] = {
    {mintgate::cli::OptionId::From, mintgate::cli::OptionType::String, "from", 'f'},
    {mintgate::cli::OptionId::At, mintgate::cli::OptionType::U64, "at", 't'},
    {mintgate::cli::OptionId::Chain, mintgate::cli::OptionType::U64, "chain", 'c'},
    {mintgate::cli::OptionId::Key, mintgate::cli::OptionType::String, "key", 'k'},
};
constexpr mintgate::core::u32 kOptionCount = sizeof(g_options) / sizeof(g_options[0]);

// ========================================================================
// Signal Handler
// ========================================================================

void sigint_handler(int sig) {
    (void)sig;
    g_running = 0;
}

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, mintgate::core::Status s) {
    fprintf(stderr, "error: %s failed (%s/%s, aux=%u)\n",
            context,
            mintgate::core::status_domain_name(s.domain),
            mintgate::core::status_code_name(s.code),
            s.aux);
}

// ========================================================================
// Argument Utilities
// ========================================================================

static bool parse_u64_arg(const char* s, mintgate::core::u64* out) {
    if (!s || !*s || !out) return false;
    int base = 10;
    if (s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s += 2;
        base = 16;
    }
    const char* end = s + std::strlen(s);
    mintgate::core::u64 v = 0;
    auto r = std::from_chars(s, end, v, base);
    if (r.ec != std::errc() || r.ptr != end || r.ptr == s) return false;
    *out = v;
    return true;
}

static bool parse_mask_arg(const char* s, mintgate::core::u32* out) {
    mintgate::core::u64 v = 0;
    if (!parse_u64_arg(s, &v) || v > 0xffffffffull) return false;
    *out = static_cast<mintgate::core::u32>(v);
    return true;
}

static bool parse_address_arg(const char* context, const char* s, mintgate::core::Address* out) {
    if (!mintgate::core::is_ok(mintgate::core::parse_address(s, out))) {
        fprintf(stderr, "error: %s: invalid address %s\n", context, s ? s : "(null)");
        return false;
    }
    return true;
}

static bool parse_word_arg(const char* context, const char* s, mintgate::core::Hash256* out) {
    if (!mintgate::core::is_ok(mintgate::core::parse_hash256(s, out))) {
        fprintf(stderr, "error: %s: expected 32-byte hex, got %s\n", context, s ? s : "(null)");
        return false;
    }
    return true;
}

static bool parse_token_id_arg(const char* context, const char* s, mintgate::core::U256* out) {
    if (!mintgate::core::is_ok(mintgate::core::parse_u256(s, out))) {
        fprintf(stderr, "error: %s: invalid token id %s\n", context, s ? s : "(null)");
        return false;
    }
    return true;
}

static std::string address_string(const mintgate::core::Address& a) {
    char buf[mintgate::core::kAddressHexChars + 1];
    mintgate::core::format_address(a, buf);
    return buf;
}

static std::string word_string(const mintgate::core::Hash256& h) {
    char buf[mintgate::core::kWordHexChars + 1];
    mintgate::core::format_hash256(h, buf);
    return buf;
}

static std::string u256_string(const mintgate::core::U256& x) {
    char buf[mintgate::core::kWordHexChars + 1];
    mintgate::core::format_u256(x, buf);
    return buf;
}

// Splits argv into positionals and options; options may appear anywhere.
// Sender, timestamp and chain id default to the session values.
static bool collect_args(const Session& session, const char* context,
                         const mintgate::cli::CliArgs& args, Invocation* inv) {
    inv->positional.clear();
    inv->ctx.sender = session.sender;
    inv->ctx.now = static_cast<mintgate::core::UnixTime>(std::time(nullptr));
    inv->ctx.chain_id = session.chain_id;
    inv->key = nullptr;

    mintgate::cli::ParsedOption storage[16];
    mintgate::core::u32 i = 0;
    while (i < args.argc) {
        mintgate::cli::ParsedOptions parsed{storage, 0, 16};
        mintgate::core::u32 consumed = 0;
        mintgate::cli::CliArgs rest{args.argv + i, args.argc - i};
        mintgate::core::Status s = mintgate::cli::parse_options(rest, g_options, kOptionCount, &parsed, &consumed);
        if (!mintgate::core::is_ok(s)) {
            fprintf(stderr, "error: %s: bad option near %s\n", context, args.argv[i]);
            return false;
        }

        for (mintgate::core::u32 j = 0; j < parsed.len; ++j) {
            const mintgate::cli::ParsedOption& opt = parsed.data[j];
            switch (opt.id) {
                case mintgate::cli::OptionId::From:
                    if (!parse_address_arg(context, opt.value.str, &inv->ctx.sender)) return false;
                    break;
                case mintgate::cli::OptionId::At:
                    inv->ctx.now = opt.value.u64v;
                    break;
                case mintgate::cli::OptionId::Chain:
                    inv->ctx.chain_id = opt.value.u64v;
                    break;
                case mintgate::cli::OptionId::Key:
                    inv->key = opt.value.str;
                    break;
                case mintgate::cli::OptionId::None:
                    break;
            }
        }

        i += consumed;
        if (i < args.argc) {
            inv->positional.push_back(args.argv[i]);
            ++i;
        }
    }
    return true;
}

// Signs `digest` with --key, or reads "v r s" from the positionals at `at`.
static bool obtain_signature(const char* context, const Invocation& inv, size_t at,
                             const mintgate::core::Hash256& digest,
                             mintgate::crypto::Signature* out) {
    if (inv.key) {
        mintgate::crypto::PrivateKey key{};
        if (!mintgate::core::is_ok(mintgate::core::hex_decode(inv.key, key.b.data(), 32))) {
            fprintf(stderr, "error: %s: --key expects 32-byte hex\n", context);
            return false;
        }
        mintgate::core::Status s = mintgate::crypto::ecdsa_sign_recoverable(key, digest, out);
        if (!mintgate::core::is_ok(s)) {
            print_status_error(context, s);
            return false;
        }
        return true;
    }

    if (inv.positional.size() != at + 3) {
        fprintf(stderr, "error: %s: expected <v> <r> <s> or --key\n", context);
        return false;
    }
    mintgate::core::u64 v = 0;
    if (!parse_u64_arg(inv.positional[at], &v) || v > 0xff) {
        fprintf(stderr, "error: %s: invalid v %s\n", context, inv.positional[at]);
        return false;
    }
    out->v = static_cast<mintgate::core::u8>(v);
    return parse_word_arg(context, inv.positional[at + 1], &out->r) &&
           parse_word_arg(context, inv.positional[at + 2], &out->s);
}

// <target> <to> <id> <validAfter> <validBefore> <nonce> starting at `at`.
static bool parse_mint_authorization(const char* context, const Invocation& inv, size_t at,
                                     mintgate::eip712::MintAuthorization* out) {
    if (inv.positional.size() < at + 6) {
        fprintf(stderr, "error: %s: expected <target> <to> <id> <validAfter> <validBefore> <nonce>\n", context);
        return false;
    }
    const char* const* p = inv.positional.data() + at;
    if (!parse_address_arg(context, p[0], &out->target)) return false;
    if (!parse_address_arg(context, p[1], &out->recipient)) return false;
    if (!parse_token_id_arg(context, p[2], &out->token_id)) return false;
    if (!mintgate::core::is_ok(mintgate::core::parse_u256(p[3], &out->valid_after)) ||
        !mintgate::core::is_ok(mintgate::core::parse_u256(p[4], &out->valid_before))) {
        fprintf(stderr, "error: %s: invalid validity window %s..%s\n", context, p[3], p[4]);
        return false;
    }
    return parse_word_arg(context, p[5], &out->nonce);
}

// ========================================================================
// Line Parsing
// ========================================================================

static void parse_line(const char* line, std::vector<std::string>* tokens) {
    tokens->clear();
    const char* p = line;
    while (*p) {
        while (*p == ' ' || *p == '\t' || *p == '\n' || *p == '\r') ++p;
        const char* start = p;
        while (*p && *p != ' ' && *p != '\t' && *p != '\n' && *p != '\r') ++p;
        if (p > start) {
            tokens->emplace_back(start, static_cast<size_t>(p - start));
        }
    }
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Commands:\n");
    printf("  as <address>                       Switch the session sender\n");
    printf("  grant <operator> <mask>            Update an operator's role bits\n");
    printf("  features [mask]                    Show or update gateway features\n");
    printf("  token add <address>                Register a collection owned by the sender;\n");
    printf("                                     the gateway gets its token creator role\n");
    printf("  token owner <address> <id>         Show the owner of a token\n");
    printf("  token supply <address>             Show a collection's supply\n");
    printf("  hardcap [value]                    Show or update the mint hardcap\n");
    printf("  mint <target> <to> <id>            Direct mint as the sender\n");
    printf("  mint-auth <target> <to> <id> <after> <before> <nonce> (<v> <r> <s> | --key <hex>)\n");
    printf("                                     Relay a signed mint authorization\n");
    printf("  cancel <authorizer> <nonce> (<v> <r> <s> | --key <hex>)\n");
    printf("                                     Relay a signed cancellation\n");
    printf("  cancel-self <nonce>                Cancel a nonce of the sender\n");
    printf("  nonce <authorizer> <nonce>         Show whether a nonce is used\n");
    printf("  digest mint <target> <to> <id> <after> <before> <nonce>\n");
    printf("  digest cancel <authorizer> <nonce> Print the typed-data digest (signs with --key)\n");
    printf("  status                             Show gateway state\n");
    printf("  events [after]                     List journaled events\n");
    printf("  help                               Show this help\n");
    printf("  q, quit, exit                      Exit REPL\n");
    printf("\n");
    printf("Options: -f/--from <address>, -t/--at <unix>, -c/--chain <id>, -k/--key <hex>\n");
}

void handle_as(Session& session, const Invocation& inv) {
    if (inv.positional.size() != 1) {
        print_error("as: expected <address>");
        return;
    }
    mintgate::core::Address who{};
    if (!parse_address_arg("as", inv.positional[0], &who)) return;
    session.sender = who;
    printf("sender=%s role=0x%08x\n", address_string(who).c_str(), session.access->user_role(who));
}

void handle_grant(Session& session, const Invocation& inv) {
    if (inv.positional.size() != 2) {
        print_error("grant: expected <operator> <mask>");
        return;
    }
    mintgate::core::Address op{};
    mintgate::core::u32 mask = 0;
    if (!parse_address_arg("grant", inv.positional[0], &op)) return;
    if (!parse_mask_arg(inv.positional[1], &mask)) {
        print_error("grant: invalid mask");
        return;
    }
    mintgate::core::u32 actual = 0;
    mintgate::core::Status s = session.access->update_role(inv.ctx.sender, op, mask, &actual);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("grant", s);
        return;
    }
    printf("role(%s)=0x%08x\n", address_string(op).c_str(), actual);
}

void handle_features(Session& session, const Invocation& inv) {
    if (inv.positional.empty()) {
        printf("features=0x%08x\n", session.access->features());
        return;
    }
    mintgate::core::u32 mask = 0;
    if (inv.positional.size() != 1 || !parse_mask_arg(inv.positional[0], &mask)) {
        print_error("features: expected [mask]");
        return;
    }
    mintgate::core::u32 actual = 0;
    mintgate::core::Status s = session.access->update_features(inv.ctx.sender, mask, &actual);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("features", s);
        return;
    }
    printf("features=0x%08x\n", actual);
}

void handle_token(Session& session, const Invocation& inv) {
    if (inv.positional.size() < 2) {
        print_error("token: expected add|owner|supply <address>");
        return;
    }
    const char* sub = inv.positional[0];
    mintgate::core::Address contract{};
    if (!parse_address_arg("token", inv.positional[1], &contract)) return;

    if (std::strcmp(sub, "add") == 0) {
        if (session.tokens->is_registered(contract)) {
            print_status_error("token add",
                mintgate::core::make_status(mintgate::core::StatusDomain::Token, mintgate::core::StatusCode::Conflict));
            return;
        }
        auto acl = std::make_unique<mintgate::access::AccessRegistry>(contract, session.sender, session.journal);
        mintgate::core::Status s =
            acl->update_role(session.sender, session.contract, mintgate::gateway::kRoleTokenCreator, nullptr);
        if (mintgate::core::is_ok(s)) {
            s = session.tokens->register_token(contract, *acl);
        }
        if (!mintgate::core::is_ok(s)) {
            print_status_error("token add", s);
            return;
        }
        session.collection_access[contract] = std::move(acl);
        printf("registered %s\n", address_string(contract).c_str());
    } else if (std::strcmp(sub, "owner") == 0) {
        if (inv.positional.size() != 3) {
            print_error("token owner: expected <address> <id>");
            return;
        }
        mintgate::core::U256 id{};
        if (!parse_token_id_arg("token owner", inv.positional[2], &id)) return;
        mintgate::core::Address owner{};
        mintgate::core::Status s = session.tokens->owner_of(contract, id, &owner);
        if (!mintgate::core::is_ok(s)) {
            print_status_error("token owner", s);
            return;
        }
        printf("%s\n", address_string(owner).c_str());
    } else if (std::strcmp(sub, "supply") == 0) {
        mintgate::core::u64 supply = 0;
        mintgate::core::Status s = session.tokens->total_supply(contract, &supply);
        if (!mintgate::core::is_ok(s)) {
            print_status_error("token supply", s);
            return;
        }
        printf("%llu\n", static_cast<unsigned long long>(supply));
    } else {
        fprintf(stderr, "error: token: unknown subcommand %s\n", sub);
    }
}

void handle_hardcap(Session& session, const Invocation& inv) {
    if (inv.positional.empty()) {
        printf("hardcap=%llu minted=%llu\n",
               static_cast<unsigned long long>(session.gateway->total_mint_hardcap()),
               static_cast<unsigned long long>(session.gateway->total_minted()));
        return;
    }
    mintgate::core::u64 value = 0;
    if (inv.positional.size() != 1 || !parse_u64_arg(inv.positional[0], &value)) {
        print_error("hardcap: expected [value]");
        return;
    }
    mintgate::core::Status s = session.gateway->update_total_mint_hardcap(inv.ctx, value);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("hardcap", s);
        return;
    }
    printf("hardcap=%llu\n", static_cast<unsigned long long>(value));
}

void handle_mint(Session& session, const Invocation& inv) {
    if (inv.positional.size() != 3) {
        print_error("mint: expected <target> <to> <id>");
        return;
    }
    mintgate::core::Address target{};
    mintgate::core::Address to{};
    mintgate::core::U256 id{};
    if (!parse_address_arg("mint", inv.positional[0], &target)) return;
    if (!parse_address_arg("mint", inv.positional[1], &to)) return;
    if (!parse_token_id_arg("mint", inv.positional[2], &id)) return;

    mintgate::core::Status s = session.gateway->mint(inv.ctx, target, to, id);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("mint", s);
        return;
    }
    printf("minted %s -> %s\n", u256_string(id).c_str(), address_string(to).c_str());
}

void handle_mint_auth(Session& session, const Invocation& inv) {
    mintgate::eip712::MintAuthorization auth{};
    if (!parse_mint_authorization("mint-auth", inv, 0, &auth)) return;

    mintgate::core::Hash256 digest{};
    mintgate::core::Status s = mintgate::eip712::mint_authorization_digest(
        session.gateway->domain(inv.ctx.chain_id), auth, &digest);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("mint-auth digest", s);
        return;
    }

    mintgate::crypto::Signature sig{};
    if (!obtain_signature("mint-auth", inv, 6, digest, &sig)) return;

    s = session.gateway->mint_with_authorization(inv.ctx, auth, sig);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("mint-auth", s);
        return;
    }
    printf("minted %s -> %s (nonce %s)\n",
           u256_string(auth.token_id).c_str(),
           address_string(auth.recipient).c_str(),
           word_string(auth.nonce).c_str());
}

void handle_cancel(Session& session, const Invocation& inv) {
    if (inv.positional.size() < 2) {
        print_error("cancel: expected <authorizer> <nonce>");
        return;
    }
    mintgate::eip712::CancelAuthorization cancel{};
    if (!parse_address_arg("cancel", inv.positional[0], &cancel.authorizer)) return;
    if (!parse_word_arg("cancel", inv.positional[1], &cancel.nonce)) return;

    mintgate::core::Hash256 digest{};
    mintgate::core::Status s = mintgate::eip712::cancel_authorization_digest(
        session.gateway->domain(inv.ctx.chain_id), cancel, &digest);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("cancel digest", s);
        return;
    }

    mintgate::crypto::Signature sig{};
    if (!obtain_signature("cancel", inv, 2, digest, &sig)) return;

    s = session.gateway->cancel_authorization(inv.ctx, cancel.authorizer, cancel.nonce, sig);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("cancel", s);
        return;
    }
    printf("cancelled %s for %s\n", word_string(cancel.nonce).c_str(), address_string(cancel.authorizer).c_str());
}

void handle_cancel_self(Session& session, const Invocation& inv) {
    mintgate::core::Nonce nonce{};
    if (inv.positional.size() != 1) {
        print_error("cancel-self: expected <nonce>");
        return;
    }
    if (!parse_word_arg("cancel-self", inv.positional[0], &nonce)) return;

    mintgate::core::Status s = session.gateway->cancel_authorization(inv.ctx, nonce);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("cancel-self", s);
        return;
    }
    printf("cancelled %s for %s\n", word_string(nonce).c_str(), address_string(inv.ctx.sender).c_str());
}

void handle_nonce(Session& session, const Invocation& inv) {
    if (inv.positional.size() != 2) {
        print_error("nonce: expected <authorizer> <nonce>");
        return;
    }
    mintgate::core::Address authorizer{};
    mintgate::core::Nonce nonce{};
    if (!parse_address_arg("nonce", inv.positional[0], &authorizer)) return;
    if (!parse_word_arg("nonce", inv.positional[1], &nonce)) return;
    printf("%s\n", session.gateway->authorization_state(authorizer, nonce) ? "used" : "unused");
}

void handle_digest(Session& session, const Invocation& inv) {
    if (inv.positional.empty()) {
        print_error("digest: expected mint|cancel");
        return;
    }
    const char* sub = inv.positional[0];
    const mintgate::eip712::Domain domain = session.gateway->domain(inv.ctx.chain_id);

    mintgate::core::Hash256 digest{};
    mintgate::core::Status s{};
    if (std::strcmp(sub, "mint") == 0) {
        mintgate::eip712::MintAuthorization auth{};
        if (!parse_mint_authorization("digest", inv, 1, &auth)) return;
        s = mintgate::eip712::mint_authorization_digest(domain, auth, &digest);
    } else if (std::strcmp(sub, "cancel") == 0) {
        if (inv.positional.size() != 3) {
            print_error("digest cancel: expected <authorizer> <nonce>");
            return;
        }
        mintgate::eip712::CancelAuthorization cancel{};
        if (!parse_address_arg("digest", inv.positional[1], &cancel.authorizer)) return;
        if (!parse_word_arg("digest", inv.positional[2], &cancel.nonce)) return;
        s = mintgate::eip712::cancel_authorization_digest(domain, cancel, &digest);
    } else {
        fprintf(stderr, "error: digest: unknown kind %s\n", sub);
        return;
    }
    if (!mintgate::core::is_ok(s)) {
        print_status_error("digest", s);
        return;
    }

    mintgate::core::Hash256 separator{};
    s = mintgate::eip712::domain_separator(domain, &separator);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("digest", s);
        return;
    }
    printf("domain_separator=%s\n", word_string(separator).c_str());
    printf("digest=%s\n", word_string(digest).c_str());

    if (inv.key) {
        mintgate::crypto::Signature sig{};
        if (!obtain_signature("digest", inv, 0, digest, &sig)) return;
        printf("v=%u r=%s s=%s\n", static_cast<unsigned>(sig.v),
               word_string(sig.r).c_str(), word_string(sig.s).c_str());
    }
}

void handle_status(const Session& session, const Invocation& inv) {
    mintgate::core::Hash256 separator{};
    mintgate::core::Status s = session.gateway->domain_separator(inv.ctx.chain_id, &separator);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("status", s);
        return;
    }
    mintgate::core::u64 journaled = 0;
    s = session.journal->count(&journaled);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("status journal", s);
    }

    printf("sender=%s role=0x%08x\n",
           address_string(inv.ctx.sender).c_str(), session.access->user_role(inv.ctx.sender));
    printf("contract=%s chain=%llu\n",
           address_string(session.gateway->verifying_contract()).c_str(),
           static_cast<unsigned long long>(inv.ctx.chain_id));
    printf("domain=%s separator=%s\n",
           session.gateway->domain(inv.ctx.chain_id).name, word_string(separator).c_str());
    printf("features=0x%08x\n", session.access->features());
    printf("minted=%llu hardcap=%llu\n",
           static_cast<unsigned long long>(session.gateway->total_minted()),
           static_cast<unsigned long long>(session.gateway->total_mint_hardcap()));
    printf("events=%llu dropped=%llu\n",
           static_cast<unsigned long long>(journaled),
           static_cast<unsigned long long>(session.journal->dropped()));
}

void handle_events(const Session& session, const Invocation& inv) {
    mintgate::core::u64 after = 0;
    if (!inv.positional.empty() && !parse_u64_arg(inv.positional[0], &after)) {
        print_error("events: expected [after]");
        return;
    }

    mintgate::db::JournalEntry entries[64];
    mintgate::core::u32 n = 64;
    mintgate::core::Status s = session.journal->read(after, entries, &n);
    if (!mintgate::core::is_ok(s)) {
        print_status_error("events", s);
        return;
    }

    for (mintgate::core::u32 i = 0; i < n; ++i) {
        const mintgate::core::Event& e = entries[i].event;
        printf("#%llu %s", static_cast<unsigned long long>(entries[i].seq), mintgate::core::event_kind_name(e.kind));
        switch (e.kind) {
            case mintgate::core::EventKind::HardcapUpdated:
                printf(" by=%s old=%llu new=%llu", address_string(e.actor).c_str(),
                       static_cast<unsigned long long>(e.old_value),
                       static_cast<unsigned long long>(e.new_value));
                break;
            case mintgate::core::EventKind::Minted:
                printf(" by=%s target=%s to=%s id=%s", address_string(e.actor).c_str(),
                       address_string(e.target).c_str(), address_string(e.recipient).c_str(),
                       u256_string(e.token_id).c_str());
                break;
            case mintgate::core::EventKind::NonceUsed:
            case mintgate::core::EventKind::NonceCancelled:
                printf(" authorizer=%s nonce=%s", address_string(e.authorizer).c_str(),
                       word_string(e.nonce).c_str());
                break;
            case mintgate::core::EventKind::RoleUpdated:
                printf(" by=%s operator=%s requested=0x%08llx actual=0x%08llx",
                       address_string(e.actor).c_str(), address_string(e.target).c_str(),
                       static_cast<unsigned long long>(e.old_value),
                       static_cast<unsigned long long>(e.new_value));
                break;
        }
        printf("\n");
    }
    if (n == 64) {
        printf("(more: events %llu)\n", static_cast<unsigned long long>(entries[n - 1].seq));
    }
}

// ========================================================================
// Main
// ========================================================================

static const char* env_or(const char* name, const char* fallback) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : fallback;
}

static bool load_config(CliConfig* cfg) {
    const char* db_path = std::getenv("MINTGATE_DB_PATH");
    const char* home = std::getenv("HOME");
    if (db_path && *db_path) {
        cfg->db_path = db_path;
    } else if (home && *home) {
        cfg->db_path = std::string(home) + "/mintgate/journal.db";
    } else {
        cfg->db_path = "/tmp/mintgate/journal.db";
    }

    cfg->domain_name = env_or("MINTGATE_DOMAIN_NAME", mintgate::gateway::kDefaultDomainName);

    const char* chain = std::getenv("MINTGATE_CHAIN_ID");
    if (chain && *chain && !parse_u64_arg(chain, &cfg->chain_id)) {
        fprintf(stderr, "mintgate: invalid MINTGATE_CHAIN_ID %s\n", chain);
        return false;
    }
    const char* hardcap = std::getenv("MINTGATE_HARDCAP");
    if (hardcap && *hardcap && !parse_u64_arg(hardcap, &cfg->hardcap)) {
        fprintf(stderr, "mintgate: invalid MINTGATE_HARDCAP %s\n", hardcap);
        return false;
    }

    const char* contract = env_or("MINTGATE_CONTRACT", kDevContract);
    if (!mintgate::core::is_ok(mintgate::core::parse_address(contract, &cfg->contract)) ||
        mintgate::core::address_is_zero(cfg->contract)) {
        fprintf(stderr, "mintgate: invalid MINTGATE_CONTRACT %s\n", contract);
        return false;
    }
    const char* owner = env_or("MINTGATE_OWNER", kDevOwner);
    if (!mintgate::core::is_ok(mintgate::core::parse_address(owner, &cfg->owner))) {
        fprintf(stderr, "mintgate: invalid MINTGATE_OWNER %s\n", owner);
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;

    signal(SIGINT, sigint_handler);

    CliConfig cfg;
    if (!load_config(&cfg)) {
        return EXIT_FAILURE;
    }

    if (cfg.db_path != ":memory:") {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(cfg.db_path).parent_path(), ec);
        if (ec) {
            fprintf(stderr, "mintgate: cannot create directory for %s: %s\n",
                    cfg.db_path.c_str(), ec.message().c_str());
        }
    }

    mintgate::db::EventJournal journal;
    mintgate::core::Status s = journal.open(mintgate::db::JournalConfig{cfg.db_path.c_str()});
    if (!mintgate::core::is_ok(s)) {
        print_status_error("journal open", s);
        return EXIT_FAILURE;
    }

    mintgate::access::AccessRegistry access(cfg.contract, cfg.owner, &journal);
    mintgate::token::TokenRegistry tokens(cfg.contract);

    mintgate::gateway::GatewayConfig gateway_cfg{};
    gateway_cfg.domain_name = cfg.domain_name.c_str();
    gateway_cfg.verifying_contract = cfg.contract;
    gateway_cfg.initial_hardcap = cfg.hardcap;
    mintgate::gateway::MintGateway gateway(gateway_cfg, access, access, tokens, journal);

    Session session{};
    session.gateway = &gateway;
    session.access = &access;
    session.tokens = &tokens;
    session.journal = &journal;
    session.contract = cfg.contract;
    session.sender = cfg.owner;
    session.chain_id = cfg.chain_id;

    const mintgate::cli::CommandSpec commands[] = {
        {mintgate::cli::CommandId::Help, "help"},
        {mintgate::cli::CommandId::As, "as"},
        {mintgate::cli::CommandId::Grant, "grant"},
        {mintgate::cli::CommandId::Features, "features"},
        {mintgate::cli::CommandId::Token, "token"},
        {mintgate::cli::CommandId::Hardcap, "hardcap"},
        {mintgate::cli::CommandId::Mint, "mint"},
        {mintgate::cli::CommandId::MintAuth, "mint-auth"},
        {mintgate::cli::CommandId::Cancel, "cancel"},
        {mintgate::cli::CommandId::CancelSelf, "cancel-self"},
        {mintgate::cli::CommandId::Nonce, "nonce"},
        {mintgate::cli::CommandId::Digest, "digest"},
        {mintgate::cli::CommandId::Status, "status"},
        {mintgate::cli::CommandId::Events, "events"},
        {mintgate::cli::CommandId::Quit, "q"},
        {mintgate::cli::CommandId::Quit, "quit"},
        {mintgate::cli::CommandId::Quit, "exit"},
    };
    const mintgate::core::u32 command_count = sizeof(commands) / sizeof(commands[0]);

    printf("MintGate - Interactive Mode\n");
    printf("domain=%s chain=%llu\n", cfg.domain_name.c_str(), static_cast<unsigned long long>(cfg.chain_id));
    printf("contract=%s\n", address_string(cfg.contract).c_str());
    printf("owner=%s\n", address_string(cfg.owner).c_str());
    printf("db_path=%s\n", cfg.db_path.c_str());
    printf("Type 'help' for commands, 'q' to quit\n\n");

    std::vector<std::string> tokens_buf;
    std::vector<const char*> words;
    Invocation inv;

    while (g_running) {
        printf("mintgate> ");
        fflush(stdout);

        char line[2048];
        if (!fgets(line, sizeof(line), stdin)) {
            break;  // EOF (Ctrl-D)
        }

        parse_line(line, &tokens_buf);
        if (tokens_buf.empty()) {
            continue;
        }
        words.clear();
        for (const std::string& t : tokens_buf) {
            words.push_back(t.c_str());
        }

        mintgate::cli::CommandInvocation cmd;
        mintgate::core::u32 consumed = 0;
        mintgate::cli::CliArgs args{words.data(), static_cast<mintgate::core::u32>(words.size())};
        s = mintgate::cli::parse_command(args, commands, command_count, &cmd, &consumed);
        if (!mintgate::core::is_ok(s)) {
            printf("error: unknown command %s\n", words[0]);
            continue;
        }

        if (!collect_args(session, words[0], cmd.args, &inv)) {
            continue;
        }

        switch (cmd.id) {
            case mintgate::cli::CommandId::Help:
                handle_help();
                break;
            case mintgate::cli::CommandId::As:
                handle_as(session, inv);
                break;
            case mintgate::cli::CommandId::Grant:
                handle_grant(session, inv);
                break;
            case mintgate::cli::CommandId::Features:
                handle_features(session, inv);
                break;
            case mintgate::cli::CommandId::Token:
                handle_token(session, inv);
                break;
            case mintgate::cli::CommandId::Hardcap:
                handle_hardcap(session, inv);
                break;
            case mintgate::cli::CommandId::Mint:
                handle_mint(session, inv);
                break;
            case mintgate::cli::CommandId::MintAuth:
                handle_mint_auth(session, inv);
                break;
            case mintgate::cli::CommandId::Cancel:
                handle_cancel(session, inv);
                break;
            case mintgate::cli::CommandId::CancelSelf:
                handle_cancel_self(session, inv);
                break;
            case mintgate::cli::CommandId::Nonce:
                handle_nonce(session, inv);
                break;
            case mintgate::cli::CommandId::Digest:
                handle_digest(session, inv);
                break;
            case mintgate::cli::CommandId::Status:
                handle_status(session, inv);
                break;
            case mintgate::cli::CommandId::Events:
                handle_events(session, inv);
                break;
            case mintgate::cli::CommandId::Quit:
                g_running = 0;
                break;
            default:
                printf("error: unknown command\n");
                break;
        }
    }

    printf("Goodbye!\n");
    journal.close();
    return EXIT_SUCCESS;
}
