/// @file emitter.cpp
/// @brief EventEmitter implementation

#include <ember/event/emitter.hpp>
#include <ember/event/array_ops.hpp>
#include <ember/core/log.hpp>

#include <utility>

namespace ember_event {

namespace {

/// Keeps the event stack index balanced when delivery throws
class EventStackGuard {
public:
    explicit EventStackGuard(std::uint32_t& index) : m_index(index) { ++m_index; }
    ~EventStackGuard() { --m_index; }

    EventStackGuard(const EventStackGuard&) = delete;
    EventStackGuard& operator=(const EventStackGuard&) = delete;

private:
    std::uint32_t& m_index;
};

} // anonymous namespace

EventEmitter::EventEmitter(EventHost& host, std::string name)
    : m_host(&host)
    , m_name(std::move(name)) {}

// =============================================================================
// Handler Lists
// =============================================================================

void EventEmitter::initialize_handlers() {
    if (m_handlers_initialized) return;

    std::int32_t count = event_count();
    if (count < 0) {
        ember_core::event_logger()->error(
            "[{}] Emitter declares negative event count {} - no events available", m_name, count);
        count = 0;
    }

    m_handlers.assign(static_cast<std::size_t>(count), {});
    m_callback_names.assign(static_cast<std::size_t>(count), {});
    m_handlers_initialized = true;
}

bool EventEmitter::is_valid_event(std::int32_t event_id) const noexcept {
    return event_id >= 0 && static_cast<std::size_t>(event_id) < m_handlers.size();
}

void EventEmitter::cleanup_handlers() {
    // nothing registered yet, or the lists are being walked by a broadcast
    if (!m_handlers_initialized || m_event_stack_index > 0) {
        return;
    }

    for (std::size_t e = 0; e < m_handlers.size(); ++e) {
        auto& handlers = m_handlers[e];
        auto& names = m_callback_names[e];

        std::size_t removed = 0;
        for (std::size_t i = 0; i < handlers.size(); ++i) {
            if (!m_host->is_valid(handlers[i])) {
                ++removed;
                continue;
            }
            if (removed > 0) {
                handlers[i - removed] = handlers[i];
                names[i - removed] = std::move(names[i]);
            }
        }

        if (removed == 0) {
            continue;
        }

        handlers.resize(handlers.size() - removed);
        names.resize(names.size() - removed);
        ember_core::event_logger()->debug(
            "[{}] Pruned {} stale handler(s) from event slot {}", m_name, removed, e);
    }
}

// =============================================================================
// Registration
// =============================================================================

void EventEmitter::register_handler(std::int32_t event_id, HandlerRef handler, const std::string& callback_name) {
    initialize_handlers();
    cleanup_handlers();

    auto log = ember_core::event_logger();

    if (!m_host->is_valid(handler)) {
        log->error("[{}] Attempted to register invalid handler {} with event slot {}",
            m_name, m_host->describe(handler), event_id);
        return;
    }

    if (!is_valid_event(event_id)) {
        log->error("[{}] Attempted to register invalid event slot {} with handler {}#{}",
            m_name, event_id, m_host->describe(handler), callback_name);
        return;
    }

    if (callback_name.empty()) {
        log->error("[{}] Attempted to register empty callback name for event slot {} with handler {}",
            m_name, event_id, m_host->describe(handler));
        return;
    }

    if (m_event_stack_index > 0) {
        log->error("[{}] Attempted to register handler {}#{} for event slot {} while event handler update is in progress",
            m_name, m_host->describe(handler), callback_name, event_id);
        return;
    }

    const auto slot = static_cast<std::size_t>(event_id);
    m_handlers[slot] = array_ops::add_element(m_handlers[slot], handler);
    m_callback_names[slot] = array_ops::add_element(m_callback_names[slot], callback_name);
}

void EventEmitter::unregister_handler(std::int32_t event_id, HandlerRef handler, const std::string& callback_name) {
    if (!m_handlers_initialized) {
        return;
    }

    cleanup_handlers();

    auto log = ember_core::event_logger();

    if (handler.is_null()) {
        log->error("[{}] Attempted to unregister null handler from event slot {}", m_name, event_id);
        return;
    }

    if (!m_host->is_valid(handler)) {
        log->error("[{}] Attempted to unregister invalid handler {} from event slot {}",
            m_name, m_host->describe(handler), event_id);
        return;
    }

    if (!is_valid_event(event_id)) {
        log->error("[{}] Attempted to unregister invalid event slot {} with handler {}#{}",
            m_name, event_id, m_host->describe(handler), callback_name);
        return;
    }

    if (callback_name.empty()) {
        log->error("[{}] Attempted to unregister empty callback name for event slot {} with handler {}",
            m_name, event_id, m_host->describe(handler));
        return;
    }

    if (m_event_stack_index > 0) {
        log->error("[{}] Attempted to unregister handler {}#{} from event slot {} while event handler update is in progress",
            m_name, m_host->describe(handler), callback_name, event_id);
        return;
    }

    const auto slot = static_cast<std::size_t>(event_id);
    const auto& handlers = m_handlers[slot];
    const auto& names = m_callback_names[slot];

    // A handler may be registered several times under different names, so keep
    // searching past each hit until the name matches or no hit remains
    std::optional<std::size_t> location = array_ops::find_element(handlers, handler);
    while (location && names[*location] != callback_name) {
        location = array_ops::find_element(handlers, handler, *location + 1);
    }

    if (!location) {
        return;
    }

    m_handlers[slot] = array_ops::remove_element(handlers, *location);
    m_callback_names[slot] = array_ops::remove_element(names, *location);
}

void EventEmitter::unregister_handler(HandlerRef handler) {
    auto log = ember_core::event_logger();

    // liveness is deliberately not checked: a destroyed handler must still be removable
    if (handler.is_null()) {
        log->error("[{}] Attempted to unregister null handler from all event slots", m_name);
        return;
    }

    if (m_event_stack_index > 0) {
        log->error("[{}] Attempted to unregister handler {} from all event slots while event handler update is in progress",
            m_name, m_host->describe(handler));
        return;
    }

    if (!m_handlers_initialized) {
        return;
    }

    for (std::size_t e = 0; e < m_handlers.size(); ++e) {
        const auto& handlers = m_handlers[e];
        const auto& names = m_callback_names[e];

        std::vector<HandlerRef> kept_handlers;
        std::vector<std::string> kept_names;
        kept_handlers.reserve(handlers.size());
        kept_names.reserve(names.size());

        for (std::size_t i = 0; i < handlers.size(); ++i) {
            if (handlers[i] == handler) {
                continue;
            }
            kept_handlers.push_back(handlers[i]);
            kept_names.push_back(names[i]);
        }

        if (kept_handlers.size() == handlers.size()) {
            continue;
        }

        m_handlers[e] = std::move(kept_handlers);
        m_callback_names[e] = std::move(kept_names);
    }
}

// =============================================================================
// Inspection
// =============================================================================

std::size_t EventEmitter::handler_count(std::int32_t event_id) const {
    if (!m_handlers_initialized || !is_valid_event(event_id)) {
        return 0;
    }
    return m_handlers[static_cast<std::size_t>(event_id)].size();
}

std::vector<Subscription> EventEmitter::subscriptions(std::int32_t event_id) const {
    std::vector<Subscription> result;
    if (!m_handlers_initialized || !is_valid_event(event_id)) {
        return result;
    }

    const auto slot = static_cast<std::size_t>(event_id);
    result.reserve(m_handlers[slot].size());
    for (std::size_t i = 0; i < m_handlers[slot].size(); ++i) {
        result.push_back(Subscription{m_handlers[slot][i], m_callback_names[slot][i]});
    }
    return result;
}

// =============================================================================
// Emission
// =============================================================================

void EventEmitter::emit_event(std::int32_t event_id) {
    // no handler has ever been registered
    if (!m_handlers_initialized) {
        return;
    }

    if (!is_valid_event(event_id)) {
        ember_core::event_logger()->error("[{}] Attempted to emit event with invalid id {}", m_name, event_id);
        return;
    }

    EventStackGuard guard(m_event_stack_index);

    // Lists cannot change length while the stack index is raised
    const auto slot = static_cast<std::size_t>(event_id);
    const auto& handlers = m_handlers[slot];
    const auto& names = m_callback_names[slot];

    for (std::size_t i = 0; i < handlers.size(); ++i) {
        const HandlerRef handler = handlers[i];
        const std::string& callback_name = names[i];

        if (!m_host->is_valid(handler)) {
            ember_core::event_logger()->warn(
                "[{}] Stale reference to event handler {}#{} for event {} - Skipped",
                m_name, m_host->describe(handler), callback_name, event_id);
            continue;
        }

        m_host->deliver(handler, callback_name);
    }
}

} // namespace ember_event
