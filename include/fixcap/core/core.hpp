#pragma once

#include "vec2.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace fixcap::core {

struct MonitorGeometry {
    int width_mm{};
    int height_mm{};
    int width_px{};
    int height_px{};

    bool valid() const {
        return width_mm > 0 && height_mm > 0 && width_px > 0 && height_px > 0;
    }

    vec2<int> mm() const { return {width_mm, height_mm}; }
    vec2<int> pixels() const { return {width_px, height_px}; }
};

enum class Orientation : uint8_t {
    UP = 0,
    DOWN,
    LEFT,
    RIGHT,
};

inline constexpr int kOrientationCount = 4;

// file_name and time_till_capture are either both set or both empty
struct TrialOutcome {
    std::optional<std::string> file_name;
    vec2<int> point_on_screen;
    std::optional<double> time_till_capture;

    bool captured() const {
        return file_name.has_value() && time_till_capture.has_value();
    }
};

struct Sample {
    std::string file_name;
    vec2<int> point_on_screen;
    double time_till_capture{};
    vec2<int> monitor_mm;
    vec2<int> monitor_pixels;
};

inline const char *to_string(Orientation orientation) {
    switch (orientation) {
    case Orientation::UP:
        return "UP";
    case Orientation::DOWN:
        return "DOWN";
    case Orientation::LEFT:
        return "LEFT";
    case Orientation::RIGHT:
        return "RIGHT";
    }
    return "UNKNOWN";
}

} // namespace fixcap::core
