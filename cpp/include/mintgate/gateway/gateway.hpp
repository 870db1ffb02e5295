#pragma once

#include <mutex>
#include <string>
#include <type_traits>

#include "mintgate/auth/recover.hpp"
#include "mintgate/core/errors.hpp"
#include "mintgate/core/events.hpp"
#include "mintgate/core/types.hpp"
#include "mintgate/eip712/digest.hpp"
#include "mintgate/gate/mint_gate.hpp"
#include "mintgate/gateway/capabilities.hpp"
#include "mintgate/ledger/nonce_ledger.hpp"

namespace mintgate::gateway {
    using u64 = mintgate::core::u64;

    inline constexpr const char* kDefaultDomainName = "MintGateway";
    inline constexpr u64 kDefaultHardcap = 10'000;

    struct GatewayConfig {
        const char* domain_name{kDefaultDomainName};
        mintgate::core::Address verifying_contract{};
        u64 initial_hardcap{kDefaultHardcap};
    };

    // Authorization orchestrator. Every public operation runs under one mutex,
    // so mutations are totally ordered and either apply in full or not at all,
    // with one deliberate exception: an authorized mint consumes its nonce
    // before the mint gate runs, and a mint gate failure does not give the
    // nonce back.
    class MintGateway {
    public:
        MintGateway(const GatewayConfig& cfg,
            const RoleStore& roles,
            const FeatureStore& features,
            MintCapability& minter,
            mintgate::core::EventSink& events);

        MintGateway(const MintGateway&) = delete;
        MintGateway& operator=(const MintGateway&) = delete;

        // Executor is ctx.sender.
        [[nodiscard]] mintgate::core::Status mint(const mintgate::core::ExecContext& ctx,
            const mintgate::core::Address& target,
            const mintgate::core::Address& recipient,
            const mintgate::core::U256& token_id) noexcept;

        // Relayed mint on behalf of whoever signed `auth`:
        //   kFeatureMintingWithAuth enabled               Gateway/FeatureDisabled
        //   valid_after < ctx.now < valid_before          Gateway/SignatureWindowInvalid
        //   signature recovers over the digest            Auth/InvalidSignature
        //   (signer, nonce) unused; consumed here         Ledger/NonceAlreadyUsed
        //   mint gate with executor = signer              Gate/...
        [[nodiscard]] mintgate::core::Status mint_with_authorization(const mintgate::core::ExecContext& ctx,
            const mintgate::eip712::MintAuthorization& auth,
            const mintgate::auth::Signature& sig) noexcept;

        // Burns `nonce` for `authorizer`; the signature must come from `authorizer`
        // itself (Gateway/AuthorizationMismatch otherwise).
        [[nodiscard]] mintgate::core::Status cancel_authorization(const mintgate::core::ExecContext& ctx,
            const mintgate::core::Address& authorizer,
            const mintgate::core::Nonce& nonce,
            const mintgate::auth::Signature& sig) noexcept;

        // Burns `nonce` for ctx.sender.
        [[nodiscard]] mintgate::core::Status cancel_authorization(const mintgate::core::ExecContext& ctx,
            const mintgate::core::Nonce& nonce) noexcept;

        // Requires kRoleHardcapManager; emits HardcapUpdated and overwrites.
        [[nodiscard]] mintgate::core::Status update_total_mint_hardcap(const mintgate::core::ExecContext& ctx,
            u64 new_hardcap) noexcept;

        [[nodiscard]] bool authorization_state(const mintgate::core::Address& authorizer,
            const mintgate::core::Nonce& nonce) const noexcept;

        [[nodiscard]] u64 total_minted() const noexcept;
        [[nodiscard]] u64 total_mint_hardcap() const noexcept;

        // Domain for the given chain; the name pointer stays valid for the
        // lifetime of the gateway.
        [[nodiscard]] mintgate::eip712::Domain domain(u64 chain_id) const noexcept;

        [[nodiscard]] mintgate::core::Status domain_separator(u64 chain_id,
            mintgate::core::Hash256* out) const noexcept;

        [[nodiscard]] const mintgate::core::Address& verifying_contract() const noexcept {
            return verifying_contract_;
        }

    private:
        const std::string domain_name_;
        const mintgate::core::Address verifying_contract_;
        const RoleStore& roles_;
        const FeatureStore& features_;
        mintgate::core::EventSink& events_;

        mutable std::mutex mutex_;
        mintgate::ledger::NonceLedger ledger_;
        mintgate::gate::MintGate gate_;
    };

    static_assert(std::is_trivially_copyable_v<GatewayConfig>);

} // namespace mintgate::gateway
