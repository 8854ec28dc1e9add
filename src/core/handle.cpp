/// @file handle.cpp
/// @brief Handle formatting

#include <ember/core/handle.hpp>

namespace ember_core {

namespace debug {

std::string format_handle_bits(std::uint32_t bits) {
    const auto handle = Handle<void>::from_bits(bits);
    if (handle.is_null()) {
        return "Handle(null)";
    }
    return "Handle(" + std::to_string(handle.index()) + "v" + std::to_string(handle.generation()) + ")";
}

} // namespace debug

} // namespace ember_core
