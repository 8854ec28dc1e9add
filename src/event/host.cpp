/// @file host.cpp
/// @brief Default EventHost behaviour

#include <ember/event/host.hpp>

namespace ember_event {

std::string EventHost::describe(HandlerRef handler) const {
    return ember_core::debug::format_handle_bits(handler.to_bits());
}

} // namespace ember_event
