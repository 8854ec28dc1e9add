#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for ember_core module

#include <cstdint>

namespace ember_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Handle Types
// =============================================================================

template<typename T>
struct Handle;

template<typename T>
class HandleAllocator;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace ember_core
