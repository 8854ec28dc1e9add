#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for ember_event

#include <ember/core/fwd.hpp>

namespace ember_event {

// Handler tag (never defined, only used to type handles)
struct Handler;

/// Weak reference to a handler object owned by the host
using HandlerRef = ember_core::Handle<Handler>;

// Core types
class EventHost;
class EventEmitter;
struct Subscription;

} // namespace ember_event
