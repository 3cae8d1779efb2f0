/**
 * @file connection_record.cpp
 * @brief Invitation encoding and state names.
 */
#include "didagent/connections/connection_record.hpp"

#include <cstdio>
#include <span>

#include "didagent/crypto/keys.hpp"

namespace didagent::connections {

namespace {

constexpr std::string_view kInvitationType =
    "did:sov:BzCbsNYhMrjHiqZDTUASHg;spec/connections/1.0/invitation";

std::string json_quote(std::string_view s) {
  std::string out = "\"";
  for (char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out + "\"";
}

std::string json_array(const std::vector<std::string>& v) {
  std::string out = "[";
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) out += ", ";
    out += json_quote(v[i]);
  }
  return out + "]";
}

} // namespace

std::string_view to_string(ConnectionState s) noexcept {
  switch (s) {
    case ConnectionState::Invitation: return "invitation";
    case ConnectionState::Request:    return "request";
    case ConnectionState::Response:   return "response";
    case ConnectionState::Active:     return "active";
    case ConnectionState::Inactive:   return "inactive";
  }
  return "unknown";
}

std::string Invitation::to_json() const {
  std::string out = "{\"@type\": " + json_quote(kInvitationType) +
                    ", \"@id\": " + json_quote(id) +
                    ", \"label\": " + json_quote(label);
  if (!did.empty()) {
    out += ", \"did\": " + json_quote(did);
  } else {
    out += ", \"recipientKeys\": " + json_array(recipient_keys) +
           ", \"serviceEndpoint\": " + json_quote(endpoint);
    if (!routing_keys.empty()) out += ", \"routingKeys\": " + json_array(routing_keys);
  }
  return out + "}";
}

std::string Invitation::to_url(std::string_view base_url) const {
  const auto json = to_json();
  const auto c_i = crypto::base64url_encode(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(json.data()), json.size()));
  return std::string(base_url.empty() ? std::string_view(endpoint) : base_url) + "?c_i=" + c_i;
}

} // namespace didagent::connections
