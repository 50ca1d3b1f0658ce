#pragma once

#include <chrono>
#include <concepts>


namespace poslink::core {

// Any chrono-style clock with a static now(). Production code runs on
// std::chrono::steady_clock; tests substitute a manually advanced clock.
template<class C>
concept ClockConcept =
    requires {
        typename C::time_point;
        typename C::duration;
        { C::now() } -> std::same_as<typename C::time_point>;
    };

} // namespace poslink::core
