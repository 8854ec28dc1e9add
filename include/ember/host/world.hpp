#pragma once

/// @file world.hpp
/// @brief Reference EventHost owning Behaviour objects

#include "fwd.hpp"
#include "behaviour.hpp"
#include <ember/core/error.hpp>
#include <ember/core/handle.hpp>
#include <ember/event/host.hpp>

#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace ember_host {

// =============================================================================
// DeliveryException
// =============================================================================

/// Thrown by World::deliver when a callback cannot be invoked
class DeliveryException : public std::exception {
public:
    explicit DeliveryException(ember_core::Error error);

    [[nodiscard]] const char* what() const noexcept override { return m_message.c_str(); }
    [[nodiscard]] const ember_core::Error& error() const noexcept { return m_error; }

private:
    ember_core::Error m_error;
    std::string m_message;
};

// =============================================================================
// World
// =============================================================================

/// Owns behaviours and hands out generational handles to them.
///
/// Destroying a behaviour invalidates its handle immediately, but the object
/// itself is kept until flush_destroyed() so that a behaviour may destroy
/// itself (or its emitter) from inside a callback.
class World final : public ember_event::EventHost {
public:
    World() = default;
    ~World() override = default;

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Create a behaviour, assign its handle and call start().
    /// Returns nullptr when the handle space is exhausted.
    template<typename B, typename... Args>
    B* spawn(Args&&... args) {
        static_assert(std::is_base_of_v<Behaviour, B>, "B must derive from Behaviour");
        auto behaviour = std::make_unique<B>(std::forward<Args>(args)...);
        B* raw = behaviour.get();
        if (!adopt(std::move(behaviour))) {
            return nullptr;
        }
        raw->start();
        return raw;
    }

    /// Call on_destroy() and invalidate the handle. Returns false for null,
    /// stale or already-destroying handles.
    bool destroy(ember_event::HandlerRef handle);

    /// Delete behaviours destroyed since the last flush; returns how many
    std::size_t flush_destroyed();

    // =========================================================================
    // Lookup
    // =========================================================================

    [[nodiscard]] Behaviour* get(ember_event::HandlerRef handle) const;

    template<typename B>
    [[nodiscard]] B* get_as(ember_event::HandlerRef handle) const {
        return dynamic_cast<B*>(get(handle));
    }

    [[nodiscard]] std::size_t behaviour_count() const noexcept { return m_allocator.len(); }
    [[nodiscard]] std::size_t pending_destroy_count() const noexcept { return m_pending_destroy.size(); }

    // =========================================================================
    // Delivery
    // =========================================================================

    /// Invoke a named callback without throwing on lookup failures
    [[nodiscard]] ember_core::Result<void> send_custom_event(
        ember_event::HandlerRef handle, std::string_view callback_name);

    // EventHost
    [[nodiscard]] bool is_valid(ember_event::HandlerRef handle) const override;
    void deliver(ember_event::HandlerRef handle, std::string_view callback_name) override;
    [[nodiscard]] std::string describe(ember_event::HandlerRef handle) const override;

private:
    bool adopt(std::unique_ptr<Behaviour> behaviour);

    ember_core::HandleAllocator<ember_event::Handler> m_allocator;
    // Indexed by handle index; empty slots are free
    std::vector<std::unique_ptr<Behaviour>> m_slots;
    std::vector<std::unique_ptr<Behaviour>> m_pending_destroy;
};

} // namespace ember_host
