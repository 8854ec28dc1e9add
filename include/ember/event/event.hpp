#pragma once

/// @file event.hpp
/// @brief Main include header for ember_event
///
/// ember_event lets an object expose a fixed set of numbered events that other
/// objects subscribe to by callback name.
///
/// ## Quick Start
///
/// ```cpp
/// class DoorEmitter : public ember_event::EventEmitter {
/// public:
///     static constexpr std::int32_t EVENT_OPENED = 0;
///     static constexpr std::int32_t EVENT_CLOSED = 1;
///     static constexpr std::int32_t EVENT_COUNT = 2;
///
///     using EventEmitter::EventEmitter;
///
///     std::int32_t event_count() const override { return EVENT_COUNT; }
///
///     void open() { emit_event(EVENT_OPENED); }
/// };
///
/// door.register_handler(DoorEmitter::EVENT_OPENED, lamp_handle, "_OnDoorOpened");
/// door.open();   // host.deliver(lamp_handle, "_OnDoorOpened")
/// door.unregister_handler(DoorEmitter::EVENT_OPENED, lamp_handle, "_OnDoorOpened");
/// ```

#include "fwd.hpp"
#include "array_ops.hpp"
#include "host.hpp"
#include "emitter.hpp"

namespace ember_event {

/// Prelude - commonly used types
namespace prelude {
    using ember_event::HandlerRef;
    using ember_event::EventHost;
    using ember_event::EventEmitter;
    using ember_event::Subscription;
} // namespace prelude

} // namespace ember_event
