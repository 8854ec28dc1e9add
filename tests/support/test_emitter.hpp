#pragma once

/// @file test_emitter.hpp
/// @brief Minimal concrete emitter exposing the protected surface

#include <ember/event/emitter.hpp>

#include <cstdint>

namespace ember_test {

class TestEmitter final : public ember_event::EventEmitter {
public:
    static constexpr std::int32_t EVENT_ONE = 0;
    static constexpr std::int32_t EVENT_TWO = 1;
    static constexpr std::int32_t EVENT_COUNT = 2;

    explicit TestEmitter(ember_event::EventHost& host, std::int32_t count = EVENT_COUNT)
        : EventEmitter(host, "test_emitter")
        , m_count(count) {}

    [[nodiscard]] std::int32_t event_count() const override { return m_count; }

    void emit(std::int32_t event_id) { emit_event(event_id); }
    void sweep() { cleanup_handlers(); }
    [[nodiscard]] std::uint32_t depth() const noexcept { return event_stack_index(); }

private:
    std::int32_t m_count;
};

} // namespace ember_test
