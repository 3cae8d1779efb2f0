/**
 * @file wallet.cpp
 * @brief wallet_config / ledger_config.
 */
#include "didagent/config/wallet.hpp"

#include <span>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "didagent/config/constants.hpp"
#include "didagent/crypto/keys.hpp"

namespace didagent::config {

    using namespace didagent::config::constants;

    std::optional<PublicDid> wallet_config(InjectionContext& context) {
        std::optional<PublicDid> public_did;

        if (auto wallet = context.inject<WalletProvisioner>(/*required=*/false)) {
            public_did = wallet->configure(context);
        } else if (auto seed = context.settings().get_string(KEY_WALLET_SEED)) {
            if (seed->size() != SEED_BYTES) {
                throw std::invalid_argument("wallet.seed must be exactly " + std::to_string(SEED_BYTES) + " bytes");
            }
            const auto keys = crypto::derive_did(
                std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(seed->data()), seed->size()));
            public_did = PublicDid{keys.did, keys.verkey};
        }

        if (public_did) {
            spdlog::info("Public DID: {}", public_did->did);
            context.injector().bind_instance<PublicDid>(std::make_shared<PublicDid>(*public_did));
        }
        return public_did;
    }

    void ledger_config(InjectionContext& context, const std::optional<PublicDid>& public_did) {
        auto ledger = context.inject<LedgerProvisioner>(/*required=*/false);
        if (!ledger) {
            spdlog::debug("No ledger configured");
            return;
        }
        ledger->configure(context, public_did);
    }

} // namespace didagent::config
