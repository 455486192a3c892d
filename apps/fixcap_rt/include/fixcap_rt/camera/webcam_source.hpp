#pragma once

#include "fixcap_rt/camera/frame_buffer.hpp"
#include "fixcap_rt/config/session_config.hpp"
#include "fixcap_rt/threading/thread.hpp"
#include <chrono>
#include <expected>
#include <fixcap/core/interfaces.hpp>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <system_error>

namespace fixcap_rt::camera {

// Reads the capture device continuously on its own thread so that the latest
// frames are always queued when the trial thread asks for one.
class WebcamSource : public fixcap::core::IFrameSource<cv::Mat>,
                     public threading::Thread<WebcamSource> {
  public:
    explicit WebcamSource(const config::CameraSettings &settings);

    // Opens the device and applies the configured properties; call before
    // Spawn()
    std::error_code Open();

    void Init();
    void Run();
    void Shutdown();

    void clearBuffer() override;
    std::expected<cv::Mat, std::error_code>
    nextFrame(std::chrono::milliseconds timeout) override;

    ~WebcamSource();

  private:
    config::CameraSettings settings_;
    cv::VideoCapture capture_;
    FrameBuffer frames_;
    size_t failedReads_{0};
};

} // namespace fixcap_rt::camera
