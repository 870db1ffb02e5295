#include "mintgate/gateway/gateway.hpp"

namespace mintgate::gateway {
    using mintgate::core::Status;
    using mintgate::core::StatusCode;
    using mintgate::core::StatusDomain;

    MintGateway::MintGateway(const GatewayConfig& cfg,
        const RoleStore& roles,
        const FeatureStore& features,
        MintCapability& minter,
        mintgate::core::EventSink& events)
        : domain_name_(cfg.domain_name != nullptr ? cfg.domain_name : kDefaultDomainName),
          verifying_contract_(cfg.verifying_contract),
          roles_(roles),
          features_(features),
          events_(events),
          ledger_(events),
          gate_(roles, minter, events, cfg.initial_hardcap) {}

    Status MintGateway::mint(const mintgate::core::ExecContext& ctx,
        const mintgate::core::Address& target,
        const mintgate::core::Address& recipient,
        const mintgate::core::U256& token_id) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return gate_.execute_mint(ctx.sender, target, recipient, token_id);
    }

    Status MintGateway::mint_with_authorization(const mintgate::core::ExecContext& ctx,
        const mintgate::eip712::MintAuthorization& auth,
        const mintgate::auth::Signature& sig) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!features_.is_enabled(kFeatureMintingWithAuth)) {
            return mintgate::core::make_status(StatusDomain::Gateway, StatusCode::FeatureDisabled);
        }
        const mintgate::core::U256 now = mintgate::core::u256_from_u64(ctx.now);
        if (now <= auth.valid_after) {
            return mintgate::core::make_status(StatusDomain::Gateway, StatusCode::SignatureWindowInvalid, 1);
        }
        if (now >= auth.valid_before) {
            return mintgate::core::make_status(StatusDomain::Gateway, StatusCode::SignatureWindowInvalid, 2);
        }

        mintgate::core::Hash256 digest{};
        Status s = mintgate::eip712::mint_authorization_digest(domain(ctx.chain_id), auth, &digest);
        if (!mintgate::core::is_ok(s)) {
            return s;
        }

        mintgate::core::Address signer{};
        s = mintgate::auth::recover_signer(digest, sig, &signer);
        if (!mintgate::core::is_ok(s)) {
            return s;
        }

        // The nonce stays consumed even if the mint below fails.
        s = ledger_.use_or_cancel(signer, auth.nonce, false);
        if (!mintgate::core::is_ok(s)) {
            return s;
        }

        return gate_.execute_mint(signer, auth.target, auth.recipient, auth.token_id);
    }

    Status MintGateway::cancel_authorization(const mintgate::core::ExecContext& ctx,
        const mintgate::core::Address& authorizer,
        const mintgate::core::Nonce& nonce,
        const mintgate::auth::Signature& sig) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);

        const mintgate::eip712::CancelAuthorization cancel{authorizer, nonce};
        mintgate::core::Hash256 digest{};
        Status s = mintgate::eip712::cancel_authorization_digest(domain(ctx.chain_id), cancel, &digest);
        if (!mintgate::core::is_ok(s)) {
            return s;
        }

        mintgate::core::Address signer{};
        s = mintgate::auth::recover_signer(digest, sig, &signer);
        if (!mintgate::core::is_ok(s)) {
            return s;
        }
        if (signer != authorizer) {
            return mintgate::core::make_status(StatusDomain::Gateway, StatusCode::AuthorizationMismatch);
        }

        return ledger_.use_or_cancel(authorizer, nonce, true);
    }

    Status MintGateway::cancel_authorization(const mintgate::core::ExecContext& ctx,
        const mintgate::core::Nonce& nonce) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return ledger_.use_or_cancel(ctx.sender, nonce, true);
    }

    Status MintGateway::update_total_mint_hardcap(const mintgate::core::ExecContext& ctx, u64 new_hardcap) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!roles_.has_role(ctx.sender, kRoleHardcapManager)) {
            return mintgate::core::make_status(StatusDomain::Gateway, StatusCode::AccessDenied);
        }

        const u64 old = gate_.replace_hardcap(new_hardcap);

        mintgate::core::Event e{};
        e.kind = mintgate::core::EventKind::HardcapUpdated;
        e.actor = ctx.sender;
        e.old_value = old;
        e.new_value = new_hardcap;
        events_.emit(e);
        return mintgate::core::ok_status();
    }

    bool MintGateway::authorization_state(const mintgate::core::Address& authorizer,
        const mintgate::core::Nonce& nonce) const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return ledger_.query_state(authorizer, nonce);
    }

    u64 MintGateway::total_minted() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return gate_.counters().total_minted;
    }

    u64 MintGateway::total_mint_hardcap() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return gate_.counters().total_mint_hardcap;
    }

    mintgate::eip712::Domain MintGateway::domain(u64 chain_id) const noexcept {
        mintgate::eip712::Domain d{};
        d.name = domain_name_.c_str();
        d.chain_id = chain_id;
        d.verifying_contract = verifying_contract_;
        return d;
    }

    Status MintGateway::domain_separator(u64 chain_id, mintgate::core::Hash256* out) const noexcept {
        return mintgate::eip712::domain_separator(domain(chain_id), out);
    }
} // namespace mintgate::gateway
