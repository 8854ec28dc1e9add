#pragma once

/// @file host.hpp
/// @brief Host environment seam used by EventEmitter

#include "fwd.hpp"
#include <ember/core/handle.hpp>

#include <string>
#include <string_view>

namespace ember_event {

/// Capabilities the surrounding environment provides to emitters.
///
/// The host owns every handler object; emitters only hold HandlerRef values
/// and ask the host whether they still refer to something live.
class EventHost {
public:
    virtual ~EventHost() = default;

    /// True while `handler` refers to a live, usable object
    [[nodiscard]] virtual bool is_valid(HandlerRef handler) const = 0;

    /// Invoke the zero-argument callback `callback_name` on `handler`.
    /// Failures are reported by throwing; emitters let them propagate.
    virtual void deliver(HandlerRef handler, std::string_view callback_name) = 0;

    /// Human readable label for diagnostics
    [[nodiscard]] virtual std::string describe(HandlerRef handler) const;
};

} // namespace ember_event
