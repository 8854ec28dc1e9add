/// @file main.cpp
/// @brief Counter Demo
///
/// An emitter with two events and a handful of receivers that count how often
/// they were notified. Shows registration from start(), per-slot unregister
/// from on_destroy(), stale receivers and bulk unregister.
///
/// Usage: ember_counter_demo [config.json]

#include <ember/core/config.hpp>
#include <ember/core/error.hpp>
#include <ember/core/log.hpp>
#include <ember/event/event.hpp>
#include <ember/host/behaviour.hpp>
#include <ember/host/world.hpp>

#include <string>
#include <vector>

namespace {

/// Emits EVENT_ONE and EVENT_TWO on request
class ExampleEventEmitter : public ember_host::Behaviour, public ember_event::EventEmitter {
public:
    static constexpr std::int32_t EVENT_ONE = 0;
    static constexpr std::int32_t EVENT_TWO = 1;
    static constexpr std::int32_t EVENT_COUNT = 2;

    explicit ExampleEventEmitter(ember_host::World& world)
        : Behaviour("example_emitter")
        , EventEmitter(world, "example_emitter") {
        bind_callback("_TriggerOne", [this] { trigger_event_one(); });
    }

    [[nodiscard]] std::int32_t event_count() const override { return EVENT_COUNT; }

    void trigger_event_one() { emit_event(EVENT_ONE); }
    void trigger_event_two() { emit_event(EVENT_TWO); }
};

/// Counts notifications for one event of an ExampleEventEmitter
class CounterReceiver : public ember_host::Behaviour {
public:
    CounterReceiver(std::string name, ember_event::HandlerRef emitter, std::int32_t event_id)
        : Behaviour(std::move(name))
        , m_emitter(emitter)
        , m_event_id(event_id) {
        bind_callback("_OnEvent", [this] {
            ++m_count;
            EMBER_LOG_INFO("{} received event {} ({} so far)", this->name(), m_event_id, m_count);
        });
    }

    void start() override {
        if (m_emitter.is_null()) {
            return;
        }
        if (auto* emitter = world()->get_as<ExampleEventEmitter>(m_emitter)) {
            emitter->register_handler(m_event_id, handle(), "_OnEvent");
        } else {
            EMBER_LOG_WARN("{}: emitter {} not found", name(), world()->describe(m_emitter));
        }
    }

    void on_destroy() override {
        if (auto* emitter = world()->get_as<ExampleEventEmitter>(m_emitter)) {
            emitter->unregister_handler(m_event_id, handle(), "_OnEvent");
        }
    }

    [[nodiscard]] int count() const noexcept { return m_count; }

private:
    ember_event::HandlerRef m_emitter;
    std::int32_t m_event_id;
    int m_count = 0;
};

ember_core::LogConfig load_config(int argc, char** argv) {
    if (argc < 2) {
        return {};
    }

    auto result = ember_core::load_log_config(argv[1]);
    if (result.is_err()) {
        EMBER_LOG_ERROR("Failed to load config: {}", ember_core::build_error_chain(result.error()));
        return {};
    }
    return result.value();
}

} // namespace

int main(int argc, char** argv) {
    ember_core::configure_logging(load_config(argc, argv));

    EMBER_LOG_INFO("=== ember counter demo ===");

    ember_host::World world;
    auto* emitter = world.spawn<ExampleEventEmitter>(world);
    if (!emitter) {
        EMBER_LOG_CRITICAL("Failed to spawn emitter");
        return 1;
    }

    std::vector<CounterReceiver*> receivers;
    receivers.push_back(world.spawn<CounterReceiver>("first", emitter->handle(), ExampleEventEmitter::EVENT_ONE));
    receivers.push_back(world.spawn<CounterReceiver>("second", emitter->handle(), ExampleEventEmitter::EVENT_ONE));
    receivers.push_back(world.spawn<CounterReceiver>("third", emitter->handle(), ExampleEventEmitter::EVENT_TWO));

    EMBER_LOG_INFO("--- trigger both events ---");
    emitter->trigger_event_one();
    emitter->trigger_event_two();

    // Triggered through the world, the same way other objects would reach it
    auto sent = world.send_custom_event(emitter->handle(), "_TriggerOne");
    if (sent.is_err()) {
        EMBER_LOG_ERROR("{}", ember_core::build_error_chain(sent.error()));
    }

    EMBER_LOG_INFO("--- destroy 'first' (unregisters itself) ---");
    world.destroy(receivers[0]->handle());
    emitter->trigger_event_one();

    EMBER_LOG_INFO("--- receiver destroyed without unregistering ---");
    auto* stray = world.spawn<CounterReceiver>("stray", ember_event::HandlerRef::null(), 0);
    emitter->register_handler(ExampleEventEmitter::EVENT_TWO, stray->handle(), "_OnEvent");
    world.destroy(stray->handle());
    emitter->trigger_event_two();
    EMBER_LOG_INFO("EVENT_TWO handlers: {}", emitter->handler_count(ExampleEventEmitter::EVENT_TWO));

    EMBER_LOG_INFO("--- bulk unregister 'third' ---");
    emitter->unregister_handler(receivers[2]->handle());
    emitter->trigger_event_two();

    // The next registration sweeps the stale 'stray' entry
    emitter->register_handler(ExampleEventEmitter::EVENT_TWO, receivers[1]->handle(), "_OnEvent");
    EMBER_LOG_INFO("EVENT_TWO handlers after sweep: {}", emitter->handler_count(ExampleEventEmitter::EVENT_TWO));
    emitter->trigger_event_two();

    EMBER_LOG_INFO("=== counts ===");
    for (const auto* receiver : receivers) {
        EMBER_LOG_INFO("  {}: {}", receiver->name(), receiver->count());
    }

    world.flush_destroyed();
    ember_core::shutdown_logging();
    return 0;
}
