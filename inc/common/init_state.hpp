#pragma once

namespace Platform {
namespace InitState {

    /**
     * Marker types for peripherals and channels that are switched on and off
     * at the type level. A driver class template takes one of these as its
     * State parameter, and only the operations valid in that state exist.
     */
    struct Disabled {};
    struct Enabled {};

} // namespace InitState
} // namespace Platform
