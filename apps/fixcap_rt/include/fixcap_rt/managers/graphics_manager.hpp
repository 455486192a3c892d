#pragma once

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "fixcap_rt/config/session_config.hpp"
#include "fixcap_rt/trial/trial_runner.hpp"
#include <fixcap/core/core.hpp>
#include <opencv2/core.hpp>
#include <raylib.h>

namespace fixcap_rt::managers {

struct MonitorInfo {
    int index;
    int width_px;
    int height_px;
    int width_mm;
    int height_mm;
    int refresh_rate;
    std::string name;
};

// Owns the raylib window. Frames are rasterised on the CPU and shown as a
// single full-screen texture. Must be used from the main thread.
class GraphicsManager : public trial::ITargetDisplay {
  public:
    GraphicsManager(const config::GraphicsSettings &settings, int quit_key);

    // Queries the attached monitors through a hidden window. Only the primary
    // monitor is used.
    void Init();

    // Opens the borderless stimulus window on the detected monitor
    std::error_code Open(const fixcap::core::MonitorGeometry &geometry);

    void Shutdown();

    // Empty when the monitor does not report its physical size
    std::optional<fixcap::core::MonitorGeometry> GetMonitorGeometry() const;

    void present(const cv::Mat &frame) override;

    // Window close counts as the quit key
    std::optional<int> waitKey(std::chrono::milliseconds timeout) override;

    ~GraphicsManager();

  private:
    enum class State : uint8_t {
        DEFAULT, // Before the stimulus window is created
        READY,
    };

    void pollMonitors_();
    void draw_();
    static void errorCallback_(int code, const char *message, va_list args);

    std::atomic<State> state_{State::DEFAULT};
    config::GraphicsSettings settings_;
    int quitKey_;

    std::vector<MonitorInfo> monitors_;
    const int monitorIndex_{0};

    Texture2D texture_{};
    cv::Mat rgba_;
};

} // namespace fixcap_rt::managers
