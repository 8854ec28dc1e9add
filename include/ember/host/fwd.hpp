#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for ember_host

#include <ember/event/fwd.hpp>

namespace ember_host {

class Behaviour;
class World;
class DeliveryException;

} // namespace ember_host
