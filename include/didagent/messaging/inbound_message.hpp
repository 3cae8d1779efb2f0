/**
 * @file inbound_message.hpp
 * @brief Message received by an inbound transport, plus its receipt metadata.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace didagent::messaging {

/**
 * @brief Whether, and how often, the sender wants replies over the same connection.
 *
 * @note Semantics:
 *  - None:   No direct response.
 *  - Thread: One response for the message's thread.
 *  - All:    Every response generated while the session is open.
 */
enum class DirectResponseMode : std::uint8_t {
  None = 0,
  Thread = 1,
  All = 2
};

/// Wire spelling: "none", "thread" or "all".
std::string_view to_string(DirectResponseMode m) noexcept;

/**
 * @brief Metadata a transport attaches to each received message.
 */
struct MessageReceipt final {
  /// Requested direct-response mode; absent when the sender said nothing.
  std::optional<DirectResponseMode> direct_response_mode;

  /// Identifier of the transport that received the message, e.g. "http".
  std::string transport_type;

  /// Keys recovered while unpacking (empty for plaintext messages).
  std::string sender_verkey;
  std::string recipient_verkey;

  /// Thread the message belongs to, if known.
  std::string thread_id;

  /// Arrival time (steady clock).
  std::chrono::steady_clock::time_point in_time{};

  /// True when a response mode other than None was requested.
  [[nodiscard]] bool direct_response_requested() const noexcept {
    return direct_response_mode.value_or(DirectResponseMode::None) != DirectResponseMode::None;
  }
};

/**
 * @brief Received message. Read-only to the router; owned by the dispatcher once queued.
 */
struct InboundMessage final {
  std::string payload;
  MessageReceipt receipt;
  /// Inbound session the message arrived on (empty when connectionless).
  std::string session_id;
};

} // namespace didagent::messaging
