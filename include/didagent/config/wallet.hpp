#pragma once
/**
 * @file wallet.hpp
 * @brief Wallet and ledger configuration steps run first during startup.
 * @details The wallet and ledger themselves are external; an application
 *          binds provisioners for them. Without a wallet provisioner a
 *          public DID can still be derived from the "wallet.seed" setting.
 */

#include <optional>
#include <string>

#include "didagent/config/injection_context.hpp"

namespace didagent::config {

    /** @struct PublicDid
     *  @brief The agent's public identity, bound in the context once selected.
     */
    struct PublicDid {
        std::string did;
        std::string verkey;

        bool operator==(const PublicDid&) const = default;
    };

    /** @class WalletProvisioner
     *  @brief Opens the wallet and selects the public DID.
     */
    class WalletProvisioner {
    public:
        virtual ~WalletProvisioner() = default;
        virtual std::optional<PublicDid> configure(InjectionContext& context) = 0;
    };

    /** @class LedgerProvisioner
     *  @brief Connects to the ledger and publishes/validates the public DID.
     */
    class LedgerProvisioner {
    public:
        virtual ~LedgerProvisioner() = default;
        virtual void configure(InjectionContext& context, const std::optional<PublicDid>& public_did) = 0;
    };

    /**
     * @brief Configure the wallet and return the public DID, if any.
     * @details Binds the result as the PublicDid capability. Exceptions propagate.
     * @throws std::invalid_argument if "wallet.seed" is not exactly 32 bytes.
     */
    std::optional<PublicDid> wallet_config(InjectionContext& context);

    /// Configure the ledger for @p public_did. Exceptions propagate.
    void ledger_config(InjectionContext& context, const std::optional<PublicDid>& public_did);

} // namespace didagent::config
