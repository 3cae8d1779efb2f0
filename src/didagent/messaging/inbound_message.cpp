/**
 * @file inbound_message.cpp
 * @brief DirectResponseMode wire spelling.
 */
#include "didagent/messaging/inbound_message.hpp"

namespace didagent::messaging {

std::string_view to_string(DirectResponseMode m) noexcept {
  switch (m) {
    case DirectResponseMode::None:   return "none";
    case DirectResponseMode::Thread: return "thread";
    case DirectResponseMode::All:    return "all";
  }
  return "none";
}

} // namespace didagent::messaging
