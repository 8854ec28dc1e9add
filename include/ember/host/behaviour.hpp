#pragma once

/// @file behaviour.hpp
/// @brief Scriptable object living in a World

#include "fwd.hpp"
#include <ember/core/handle.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace ember_host {

/// Base class for objects owned by a World.
///
/// A behaviour exposes zero-argument callbacks by name; the world invokes
/// them when an emitter delivers an event to the behaviour's handle.
class Behaviour {
public:
    explicit Behaviour(std::string name);
    virtual ~Behaviour() = default;

    Behaviour(const Behaviour&) = delete;
    Behaviour& operator=(const Behaviour&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    /// Handle assigned by the owning world (null before spawn)
    [[nodiscard]] ember_event::HandlerRef handle() const noexcept { return m_handle; }

    /// Owning world (null before spawn)
    [[nodiscard]] World* world() const noexcept { return m_world; }

    [[nodiscard]] bool has_callback(std::string_view callback_name) const;

    /// Invoke a bound callback. Returns false when nothing is bound under the name.
    bool send_custom_event(std::string_view callback_name);

    /// Called once after the world has assigned a handle
    virtual void start() {}

    /// Called once before the handle is invalidated
    virtual void on_destroy() {}

protected:
    /// Expose `callback` under `callback_name`, replacing any previous binding
    void bind_callback(std::string callback_name, std::function<void()> callback);

private:
    friend class World;

    std::string m_name;
    ember_event::HandlerRef m_handle;
    World* m_world = nullptr;
    bool m_destroying = false;
    std::map<std::string, std::function<void()>, std::less<>> m_callbacks;
};

} // namespace ember_host
