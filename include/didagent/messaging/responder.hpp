/**
 * @file responder.hpp
 * @brief Router callback types and the responder interface used to send replies.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "didagent/messaging/inbound_message.hpp"
#include "didagent/messaging/outbound_message.hpp"

namespace didagent::config { class InjectionContext; }

namespace didagent::messaging {

/**
 * @brief What the outbound router did with a message.
 *
 * Every value is terminal: nothing is held back for a later retry.
 */
enum class OutboundStatus : std::uint8_t {
  Queued = 0,            ///< Accepted by a transport for sending
  DroppedUnresolved,     ///< Connection targets could not be resolved
  DroppedUndeliverable   ///< No transport serves any target endpoint
};

std::string_view to_string(OutboundStatus s) noexcept;

/// Entry point that accepts every received message (fn(message)).
using InboundRouter = std::function<void(InboundMessage)>;

/// Entry point every outbound message goes through (fn(context, message, originating inbound)).
using OutboundRouter = std::function<OutboundStatus(config::InjectionContext&,
                                                    OutboundMessage,
                                                    const InboundMessage*)>;

/**
 * @brief Anything that accepts outbound messages on behalf of protocol logic.
 */
class BaseResponder {
public:
  virtual ~BaseResponder() = default;

  /// Send @p message through the agent's outbound path.
  virtual OutboundStatus send_outbound(OutboundMessage message) = 0;

  /// Notify external listeners about a state change; default does nothing.
  virtual void send_webhook(std::string_view topic, std::string payload) {
    (void)topic;
    (void)payload;
  }
};

/**
 * @brief Responder that forwards to an OutboundRouter with a fixed context.
 *
 * When built for a received message, replies carry that message as their
 * origin so the router can correlate them.
 */
class RouterResponder : public BaseResponder {
public:
  RouterResponder(std::shared_ptr<config::InjectionContext> context,
                  OutboundRouter router,
                  std::optional<InboundMessage> origin = std::nullopt);

  OutboundStatus send_outbound(OutboundMessage message) override;

  [[nodiscard]] const std::optional<InboundMessage>& origin() const noexcept { return origin_; }

private:
  std::shared_ptr<config::InjectionContext> context_;
  OutboundRouter router_;
  std::optional<InboundMessage> origin_;
};

} // namespace didagent::messaging
