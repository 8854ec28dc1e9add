/// @file world.cpp
/// @brief World implementation

#include <ember/host/world.hpp>
#include <ember/core/log.hpp>

#include <sstream>

namespace ember_host {

// =============================================================================
// DeliveryException
// =============================================================================

DeliveryException::DeliveryException(ember_core::Error error)
    : m_error(std::move(error))
    , m_message(ember_core::build_error_chain(m_error)) {}

// =============================================================================
// Lifecycle
// =============================================================================

bool World::adopt(std::unique_ptr<Behaviour> behaviour) {
    auto handle = m_allocator.allocate();
    if (handle.is_null()) {
        ember_core::host_logger()->error("Handle space exhausted, cannot spawn '{}'", behaviour->name());
        return false;
    }

    behaviour->m_handle = handle;
    behaviour->m_world = this;

    const auto index = handle.index();
    if (index >= m_slots.size()) {
        m_slots.resize(index + 1);
    }
    m_slots[index] = std::move(behaviour);

    ember_core::host_logger()->trace("Spawned {}", describe(handle));
    return true;
}

bool World::destroy(ember_event::HandlerRef handle) {
    Behaviour* behaviour = get(handle);
    if (!behaviour || behaviour->m_destroying) {
        return false;
    }

    behaviour->m_destroying = true;
    behaviour->on_destroy();

    ember_core::host_logger()->trace("Destroyed {}", describe(handle));

    m_allocator.free(handle);
    m_pending_destroy.push_back(std::move(m_slots[handle.index()]));
    return true;
}

std::size_t World::flush_destroyed() {
    // destructors must not observe a half-cleared list
    auto pending = std::move(m_pending_destroy);
    m_pending_destroy.clear();
    return pending.size();
}

// =============================================================================
// Lookup
// =============================================================================

Behaviour* World::get(ember_event::HandlerRef handle) const {
    if (!m_allocator.is_valid(handle)) {
        return nullptr;
    }
    const auto index = handle.index();
    if (index >= m_slots.size()) {
        return nullptr;
    }
    return m_slots[index].get();
}

bool World::is_valid(ember_event::HandlerRef handle) const {
    return get(handle) != nullptr;
}

std::string World::describe(ember_event::HandlerRef handle) const {
    if (handle.is_null()) {
        return "<null>";
    }

    std::ostringstream oss;
    if (const Behaviour* behaviour = get(handle)) {
        oss << behaviour->name();
    } else {
        oss << "<destroyed>";
    }
    oss << " (" << handle.index() << "v" << static_cast<int>(handle.generation()) << ")";
    return oss.str();
}

// =============================================================================
// Delivery
// =============================================================================

ember_core::Result<void> World::send_custom_event(
    ember_event::HandlerRef handle, std::string_view callback_name) {
    if (handle.is_null()) {
        return ember_core::Err(ember_core::HandleError::null());
    }

    Behaviour* behaviour = get(handle);
    if (!behaviour) {
        return ember_core::Err(ember_core::HandleError::stale());
    }

    if (callback_name.empty()) {
        return ember_core::Err(ember_core::DeliveryError::empty_name(behaviour->name()));
    }

    if (!behaviour->send_custom_event(callback_name)) {
        return ember_core::Err(
            ember_core::DeliveryError::unknown_callback(behaviour->name(), std::string(callback_name)));
    }

    return ember_core::Ok();
}

void World::deliver(ember_event::HandlerRef handle, std::string_view callback_name) {
    auto result = send_custom_event(handle, callback_name);
    if (result.is_err()) {
        ember_core::Error error = result.error();
        error.with_context("handler", describe(handle));
        throw DeliveryException(std::move(error));
    }
}

} // namespace ember_host
