#pragma once

namespace fixcap {

template <typename T> struct vec2 {
    T x{};
    T y{};

    constexpr bool operator==(const vec2 &other) const = default;
};

} // namespace fixcap
