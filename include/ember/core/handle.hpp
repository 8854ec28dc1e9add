#pragma once

/// @file handle.hpp
/// @brief Generational handles for objects that can disappear
///
/// A handle packs a 24-bit slot index and an 8-bit generation. Freeing a slot
/// bumps its generation, so handles to the old occupant stop matching and can
/// be recognised as stale instead of silently reaching a newer object.

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace ember_core {

namespace handle_constants {
    constexpr std::uint32_t INDEX_BITS = 24;
    constexpr std::uint32_t MAX_INDEX = (1u << INDEX_BITS) - 1;
    constexpr std::uint8_t MAX_GENERATION = UINT8_MAX;
    constexpr std::uint32_t NULL_BITS = UINT32_MAX;
}

// =============================================================================
// Handle<T>
// =============================================================================

/// Layout: [generation:8 | index:24]. The default value is the null handle.
template<typename T>
struct Handle {
    std::uint32_t bits = handle_constants::NULL_BITS;

    [[nodiscard]] static constexpr Handle create(std::uint32_t index, std::uint8_t generation) noexcept {
        return from_bits((static_cast<std::uint32_t>(generation) << handle_constants::INDEX_BITS)
            | (index & handle_constants::MAX_INDEX));
    }

    [[nodiscard]] static constexpr Handle from_bits(std::uint32_t raw) noexcept {
        Handle h;
        h.bits = raw;
        return h;
    }

    [[nodiscard]] static constexpr Handle null() noexcept { return Handle{}; }

    /// Null test only; liveness is answered by the allocator that issued it
    [[nodiscard]] constexpr bool is_null() const noexcept { return bits == handle_constants::NULL_BITS; }
    explicit constexpr operator bool() const noexcept { return !is_null(); }

    [[nodiscard]] constexpr std::uint32_t index() const noexcept { return bits & handle_constants::MAX_INDEX; }
    [[nodiscard]] constexpr std::uint8_t generation() const noexcept {
        return static_cast<std::uint8_t>(bits >> handle_constants::INDEX_BITS);
    }
    [[nodiscard]] constexpr std::uint32_t to_bits() const noexcept { return bits; }

    constexpr bool operator==(const Handle&) const noexcept = default;
};

// =============================================================================
// HandleAllocator<T>
// =============================================================================

/// Issues handles and tracks which of them are still live.
///
/// A slot whose generation reaches MAX_GENERATION is retired instead of being
/// recycled, so a handle can never come back to life through wrap-around.
template<typename T>
class HandleAllocator {
public:
    /// Null when the index space is exhausted
    [[nodiscard]] Handle<T> allocate() {
        if (!m_free_list.empty()) {
            const std::uint32_t index = m_free_list.back();
            m_free_list.pop_back();
            return Handle<T>::create(index, m_generations[index]);
        }

        const auto index = static_cast<std::uint32_t>(m_generations.size());
        if (index > handle_constants::MAX_INDEX) {
            return Handle<T>::null();
        }
        m_generations.push_back(0);
        return Handle<T>::create(index, 0);
    }

    /// Invalidate `handle`. False when it was not live.
    bool free(Handle<T> handle) {
        if (!is_valid(handle)) {
            return false;
        }

        const std::uint32_t index = handle.index();
        ++m_generations[index];
        if (m_generations[index] == handle_constants::MAX_GENERATION) {
            ++m_retired;
        } else {
            m_free_list.push_back(index);
        }
        return true;
    }

    [[nodiscard]] bool is_valid(Handle<T> handle) const {
        if (handle.is_null() || handle.index() >= m_generations.size()) {
            return false;
        }
        return m_generations[handle.index()] == handle.generation()
            && handle.generation() != handle_constants::MAX_GENERATION;
    }

    /// Live handles
    [[nodiscard]] std::size_t len() const noexcept {
        return m_generations.size() - m_free_list.size() - m_retired;
    }

    /// Slots ever issued, live or not
    [[nodiscard]] std::size_t capacity() const noexcept { return m_generations.size(); }

    [[nodiscard]] std::size_t retired_count() const noexcept { return m_retired; }

private:
    std::vector<std::uint8_t> m_generations;
    std::vector<std::uint32_t> m_free_list;
    std::size_t m_retired = 0;
};

namespace debug {

/// "Handle(<index>v<generation>)" or "Handle(null)"
std::string format_handle_bits(std::uint32_t bits);

} // namespace debug

template<typename T>
std::ostream& operator<<(std::ostream& os, const Handle<T>& h) {
    return os << debug::format_handle_bits(h.to_bits());
}

} // namespace ember_core

template<typename T>
struct std::hash<ember_core::Handle<T>> {
    std::size_t operator()(const ember_core::Handle<T>& h) const noexcept {
        return std::hash<std::uint32_t>{}(h.bits);
    }
};
