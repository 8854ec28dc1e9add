/// @file behaviour.cpp
/// @brief Behaviour implementation

#include <ember/host/behaviour.hpp>

#include <utility>

namespace ember_host {

Behaviour::Behaviour(std::string name)
    : m_name(std::move(name)) {}

bool Behaviour::has_callback(std::string_view callback_name) const {
    return m_callbacks.find(callback_name) != m_callbacks.end();
}

bool Behaviour::send_custom_event(std::string_view callback_name) {
    auto it = m_callbacks.find(callback_name);
    if (it == m_callbacks.end()) {
        return false;
    }

    // copy: the callback may rebind itself while running
    auto callback = it->second;
    callback();
    return true;
}

void Behaviour::bind_callback(std::string callback_name, std::function<void()> callback) {
    m_callbacks[std::move(callback_name)] = std::move(callback);
}

} // namespace ember_host
