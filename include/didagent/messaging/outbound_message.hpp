/**
 * @file outbound_message.hpp
 * @brief Outbound message model and its resolved delivery targets.
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace didagent::messaging {

/**
 * @brief Resolved delivery destination for a message.
 *
 * Produced by the connection manager; immutable once built.
 */
struct ConnectionTarget final {
  /// DID of the recipient, if known.
  std::string did;

  /// Service endpoint URL, e.g. "http://peer:8020".
  std::string endpoint;

  /// Recipient label for humans/logs.
  std::string label;

  /// Keys the payload is packed for.
  std::vector<std::string> recipient_keys;

  /// Mediator keys to wrap through, outermost last.
  std::vector<std::string> routing_keys;

  /// Our key used to pack.
  std::string sender_key;

  bool operator==(const ConnectionTarget&) const = default;
};

using ConnectionTargetList = std::vector<ConnectionTarget>;

/**
 * @brief Message produced by protocol logic for delivery.
 *
 * The outbound router fills `target_list` at most once (when neither target
 * field is set and a connection id is); the outbound transport manager owns
 * the message after delivery is accepted.
 */
struct OutboundMessage final {
  std::string payload;
  std::optional<ConnectionTarget> target;
  std::optional<ConnectionTargetList> target_list;
  std::optional<std::string> connection_id;
  std::string reply_thread_id;
  std::string reply_to_verkey;

  /// True when an explicit target or a non-empty target list is present.
  [[nodiscard]] bool has_targets() const noexcept {
    return target.has_value() || (target_list && !target_list->empty());
  }
};

} // namespace didagent::messaging
