#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fixcap_rt::config {

struct CameraSettings {
    int device_index{0};
    // 0 keeps the driver default
    int width{0};
    int height{0};
    int fps{0};
    int buffer_size{1};
    int queue_capacity{4};
    int frame_timeout_ms{1000};
};

struct GraphicsSettings {
    bool vsync{true};
    int target_fps{60};
};

struct StimulusSettings {
    std::string glyph{"E"};
    double text_scale{0.5};
    int text_thickness{2};
};

struct TimingSettings {
    int frame_interval_ms{500};
    int animation_tick_ms{50};
    int capture_window_ms{500};
    int capture_tick_ms{42};
    int settle_delay_ms{500};
    int inter_trial_delay_ms{500};
};

struct SessionConfig {
    std::string base_path{"./data/p00"};
    std::optional<std::array<int, 2>> monitor_mm{};
    std::optional<std::array<int, 2>> monitor_pixels{};
    std::vector<std::string> outputs{"csv"};
    std::string broadcast_address{"ipc:///tmp/fixcap-pub.sock"};
    std::optional<uint64_t> seed{};
    std::string log_level{"info"};
    int quit_key{81}; // KEY_Q
    CameraSettings camera{};
    GraphicsSettings graphics{};
    StimulusSettings stimulus{};
    TimingSettings timing{};
};

// All of these throw std::runtime_error with a readable message on failure.
SessionConfig ReadSessionConfig(const std::string &json);
SessionConfig LoadSessionConfig(const std::filesystem::path &path);
SessionConfig ParseCommandLine(int argc, char **argv);
void ValidateSessionConfig(const SessionConfig &config);

// "1920,1080" -> {1920, 1080}
std::array<int, 2> ParsePair(std::string_view text);

} // namespace fixcap_rt::config
