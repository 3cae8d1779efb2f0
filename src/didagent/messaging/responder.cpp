/**
 * @file responder.cpp
 * @brief RouterResponder and OutboundStatus spellings.
 */
#include "didagent/messaging/responder.hpp"

#include <stdexcept>

#include "didagent/config/injection_context.hpp"

namespace didagent::messaging {

std::string_view to_string(OutboundStatus s) noexcept {
  switch (s) {
    case OutboundStatus::Queued:               return "queued";
    case OutboundStatus::DroppedUnresolved:    return "dropped_unresolved";
    case OutboundStatus::DroppedUndeliverable: return "dropped_undeliverable";
  }
  return "unknown";
}

RouterResponder::RouterResponder(std::shared_ptr<config::InjectionContext> context,
                                 OutboundRouter router,
                                 std::optional<InboundMessage> origin)
    : context_(std::move(context)), router_(std::move(router)), origin_(std::move(origin)) {
  if (!context_ || !router_) {
    throw std::invalid_argument("RouterResponder requires a context and a router");
  }
}

OutboundStatus RouterResponder::send_outbound(OutboundMessage message) {
  return router_(*context_, std::move(message), origin_ ? &*origin_ : nullptr);
}

} // namespace didagent::messaging
