/**
 * @file connection_record.hpp
 * @brief Pairwise connection, invitation and DID document models.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace didagent::connections {

/**
 * @brief Connection protocol state.
 */
enum class ConnectionState : std::uint8_t {
  Invitation = 0, ///< Invitation issued, no request yet
  Request,        ///< Request exchanged
  Response,       ///< Response exchanged
  Active,         ///< Usable for messaging
  Inactive        ///< Closed or abandoned
};

std::string_view to_string(ConnectionState s) noexcept;

/**
 * @brief Stored state of one pairwise connection.
 */
struct ConnectionRecord final {
  std::string connection_id;
  ConnectionState state{ConnectionState::Invitation};

  std::string my_did;
  std::string my_verkey;

  std::string their_did;
  std::string their_verkey;
  std::string their_label;
  std::string their_endpoint;
  std::string their_role;
  std::vector<std::string> their_routing_keys;

  std::string alias;
  /// Key the invitation was issued under (empty for static connections).
  std::string invitation_key;
  /// Whether the invitation may be accepted more than once.
  bool multi_use{false};

  [[nodiscard]] bool is_active() const noexcept { return state == ConnectionState::Active; }
};

/**
 * @brief Service description of a DID.
 */
struct DidDocument final {
  std::string did;
  std::string verkey;
  std::string endpoint;
  std::vector<std::string> routing_keys;
};

/**
 * @brief Out-of-band invitation to connect.
 *
 * Either a public `did`, or `recipient_keys` + `endpoint` for a pairwise one.
 */
struct Invitation final {
  std::string id;
  std::string label;
  std::string did;
  std::vector<std::string> recipient_keys;
  std::string endpoint;
  std::vector<std::string> routing_keys;

  /// Message JSON (connections/1.0/invitation).
  [[nodiscard]] std::string to_json() const;

  /**
   * @brief Shareable URL: `<base>?c_i=<base64url(json)>`.
   * @param base_url Prefix; when empty the invitation endpoint is used.
   */
  [[nodiscard]] std::string to_url(std::string_view base_url = {}) const;
};

} // namespace didagent::connections
