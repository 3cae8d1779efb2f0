#pragma once
/**
 * @file connection_manager.hpp
 * @brief Resolves connections to delivery targets and establishes new connections.
 */

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

#include "didagent/config/injection_context.hpp"
#include "didagent/connections/connection_record.hpp"
#include "didagent/connections/connection_store.hpp"
#include "didagent/messaging/inbound_message.hpp"
#include "didagent/messaging/outbound_message.hpp"
#include "didagent/stats/collector.hpp"

namespace didagent::connections {

    /// Connection lookup or establishment failed.
    class ConnectionManagerError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Result of create_invitation; no record is kept for a public invitation.
    struct InvitationResult {
        std::optional<ConnectionRecord> connection;
        Invitation invitation;
    };

    /** @class ConnectionManager
     *  @brief Lightweight per-use facade over the context's ConnectionStore.
     *
     *  Cheap to construct per request; must not outlive the context. Instrumentation is class-level: all
     *  instances share one slot for "get_connection_targets",
     *  "fetch_did_document" and "find_message_connection".
     */
    class ConnectionManager {
    public:
        /// @throws config::InjectionError when no ConnectionStore is bound.
        explicit ConnectionManager(config::InjectionContext& context);
        virtual ~ConnectionManager() = default;

        /**
         * @brief Live delivery targets of a connection.
         * @throws ConnectionManagerError when the connection is unknown, not
         *         active, or has no endpoint.
         */
        virtual messaging::ConnectionTargetList get_connection_targets(const std::string& connection_id);

        /**
         * @brief Create an active connection from fixed seeds (no protocol exchange).
         * @param my_seed 32-byte seed for our side.
         * @param their_seed 32-byte seed for the peer.
         */
        virtual ConnectionRecord create_static_connection(std::span<const std::uint8_t> my_seed,
                                                          std::span<const std::uint8_t> their_seed,
                                                          const std::string& their_endpoint,
                                                          const std::string& their_role,
                                                          const std::string& alias);

        /**
         * @brief Issue an invitation.
         * @param public_invitation Use the public DID instead of a fresh key.
         * @throws ConnectionManagerError for a public invitation without a public DID.
         */
        virtual InvitationResult create_invitation(const std::string& their_role,
                                                   const std::string& my_label,
                                                   bool multi_use,
                                                   bool public_invitation);

        /// Connection a received message belongs to, matched by its receipt keys.
        virtual std::optional<ConnectionRecord> find_message_connection(const messaging::InboundMessage& message);

        /// @throws ConnectionManagerError for an unknown DID.
        virtual DidDocument fetch_did_document(const std::string& did);

        /// Slot shared by every ConnectionManager instance.
        static stats::Instrumentation& instrumentation();

    protected:
        config::InjectionContext& context_;
        std::shared_ptr<ConnectionStore> store_;
    };

} // namespace didagent::connections
