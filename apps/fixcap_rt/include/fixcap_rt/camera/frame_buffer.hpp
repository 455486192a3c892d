#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <fixcap/core/queue.hpp>
#include <opencv2/core.hpp>
#include <system_error>

namespace fixcap_rt::camera {

struct StampedFrame {
    std::chrono::steady_clock::time_point acquired;
    cv::Mat image;
};

// Bounded hand-off between the camera reader and the trial thread. Frames
// stamped before the last clear are never handed out, even when a read that
// started earlier is pushed after the clear.
class FrameBuffer {
  public:
    explicit FrameBuffer(size_t capacity);

    void push(StampedFrame frame);

    // Drops everything queued and marks the current time as the clear point
    void clear();

    // Next frame acquired at or after the last clear; timed_out otherwise
    std::expected<cv::Mat, std::error_code>
    next(std::chrono::milliseconds timeout);

    size_t dropped() const { return frames_.dropped(); }

  private:
    fixcap::core::Queue<StampedFrame> frames_;

    // Written and read only by the trial thread
    std::chrono::steady_clock::time_point clearedAt_{};
};

} // namespace fixcap_rt::camera
