#pragma once

/// @file emitter.hpp
/// @brief Per-object event emitter with named-callback handlers
///
/// An emitter declares a fixed number of event slots. Handlers register for a
/// slot under the name of a zero-argument callback; emitting the slot asks the
/// host to invoke every registered callback in registration order.
///
/// Registration bookkeeping rules:
/// - the same handler may be registered any number of times, each entry fires
/// - handlers destroyed without unregistering are skipped with a warning and
///   pruned by the next sweep
/// - register/unregister are rejected while a broadcast is in progress
///
/// Misuse never throws. It is logged to the `ember_event` logger and ignored.

#include "fwd.hpp"
#include "host.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ember_event {

// =============================================================================
// Subscription
// =============================================================================

/// Snapshot of a single registration entry
struct Subscription {
    HandlerRef handler;
    std::string callback_name;

    bool operator==(const Subscription&) const = default;
};

// =============================================================================
// EventEmitter
// =============================================================================

/// Base class for objects emitting a fixed set of events
class EventEmitter {
public:
    /// @param host environment used for liveness checks and delivery
    /// @param name label used in diagnostics
    EventEmitter(EventHost& host, std::string name);
    virtual ~EventEmitter() = default;

    // Non-copyable, non-movable (handlers hold references to emitters)
    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;
    EventEmitter(EventEmitter&&) = delete;
    EventEmitter& operator=(EventEmitter&&) = delete;

    /// Total number of events emitted by this implementation. Must not change
    /// over the lifetime of the object.
    [[nodiscard]] virtual std::int32_t event_count() const = 0;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Register `handler` to receive `callback_name` whenever `event_id` fires
    void register_handler(std::int32_t event_id, HandlerRef handler, const std::string& callback_name);

    /// Remove the first registration of (`handler`, `callback_name`) for `event_id`
    void unregister_handler(std::int32_t event_id, HandlerRef handler, const std::string& callback_name);

    /// Remove every registration of `handler` from all events.
    /// The handler does not need to be alive anymore.
    void unregister_handler(HandlerRef handler);

    // =========================================================================
    // Inspection
    // =========================================================================

    /// Whether a broadcast is currently running on this emitter
    [[nodiscard]] bool is_updating_handlers() const noexcept { return m_event_stack_index > 0; }

    /// Whether the handler lists have been allocated
    [[nodiscard]] bool handlers_initialized() const noexcept { return m_handlers_initialized; }

    /// Number of registrations for `event_id` (0 when out of range)
    [[nodiscard]] std::size_t handler_count(std::int32_t event_id) const;

    /// Registrations for `event_id` in delivery order
    [[nodiscard]] std::vector<Subscription> subscriptions(std::int32_t event_id) const;

    [[nodiscard]] const std::string& emitter_name() const noexcept { return m_name; }

protected:
    /// Deliver `event_id` to every registered handler
    void emit_event(std::int32_t event_id);

    /// Drop registrations whose handler is no longer alive
    void cleanup_handlers();

    /// Depth of nested broadcasts, zero when idle
    [[nodiscard]] std::uint32_t event_stack_index() const noexcept { return m_event_stack_index; }

    [[nodiscard]] EventHost& host() const noexcept { return *m_host; }

private:
    void initialize_handlers();
    [[nodiscard]] bool is_valid_event(std::int32_t event_id) const noexcept;

    EventHost* m_host;
    std::string m_name;

    bool m_handlers_initialized = false;
    // Index-aligned: m_callback_names[e][i] belongs to m_handlers[e][i]
    std::vector<std::vector<HandlerRef>> m_handlers;
    std::vector<std::vector<std::string>> m_callback_names;

    std::uint32_t m_event_stack_index = 0;
};

} // namespace ember_event
