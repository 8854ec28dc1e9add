#pragma once

/// @file array_ops.hpp
/// @brief Copying helpers for ordered fixed-length sequences
///
/// Every mutation returns a new vector and leaves the source untouched, so a
/// sequence handed out earlier never changes length underneath its reader.

#include <ember/core/handle.hpp>

#include <cassert>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace ember_event::array_ops {

// =============================================================================
// Absent Values
// =============================================================================

/// Decides whether a value is "absent" (null). Absent values never compare
/// equal in find_element, not even to each other.
template<typename T>
struct AbsentTraits {
    static constexpr bool is_absent(const T&) noexcept { return false; }
};

template<typename T>
struct AbsentTraits<T*> {
    static constexpr bool is_absent(T* const& value) noexcept { return value == nullptr; }
};

template<typename T>
struct AbsentTraits<std::optional<T>> {
    static constexpr bool is_absent(const std::optional<T>& value) noexcept { return !value.has_value(); }
};

template<typename T>
struct AbsentTraits<std::shared_ptr<T>> {
    static bool is_absent(const std::shared_ptr<T>& value) noexcept { return value == nullptr; }
};

template<typename T>
struct AbsentTraits<ember_core::Handle<T>> {
    static constexpr bool is_absent(const ember_core::Handle<T>& value) noexcept { return value.is_null(); }
};

template<typename T>
[[nodiscard]] constexpr bool is_absent(const T& value) noexcept {
    return AbsentTraits<T>::is_absent(value);
}

// =============================================================================
// Operations
// =============================================================================

/// Locate the first element equal to `element` at or after `offset`.
/// Resume past a previous hit with `offset = hit + 1` to visit every occurrence.
template<typename T>
[[nodiscard]] std::optional<std::size_t> find_element(
    const std::vector<T>& source, const T& element, std::size_t offset = 0) {
    if (is_absent(element)) {
        return std::nullopt;
    }

    for (std::size_t i = offset; i < source.size(); ++i) {
        const T& existing = source[i];
        if (is_absent(existing) || !(existing == element)) {
            continue;
        }
        return i;
    }
    return std::nullopt;
}

/// Copy of `source` with `element` appended at its end
template<typename T>
[[nodiscard]] std::vector<T> add_element(const std::vector<T>& source, const T& element) {
    std::vector<T> result;
    result.reserve(source.size() + 1);
    result.insert(result.end(), source.begin(), source.end());
    result.push_back(element);
    return result;
}

/// Copy of `source` without the element at `index`. `index` must be in range.
template<typename T>
[[nodiscard]] std::vector<T> remove_element(const std::vector<T>& source, std::size_t index) {
    assert(index < source.size());

    std::vector<T> result;
    result.reserve(source.size() - 1);
    for (std::size_t i = 0; i < source.size(); ++i) {
        if (i == index) {
            continue;
        }
        result.push_back(source[i]);
    }
    return result;
}

} // namespace ember_event::array_ops
