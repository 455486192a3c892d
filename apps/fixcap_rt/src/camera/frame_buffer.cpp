#include "fixcap_rt/camera/frame_buffer.hpp"

namespace fixcap_rt::camera {

using namespace std::chrono;

FrameBuffer::FrameBuffer(size_t capacity) : frames_(capacity) {}

void FrameBuffer::push(StampedFrame frame) { frames_.push(std::move(frame)); }

void FrameBuffer::clear() {
    frames_.clear_and([this] { clearedAt_ = steady_clock::now(); });
}

std::expected<cv::Mat, std::error_code>
FrameBuffer::next(milliseconds timeout) {
    const auto deadline = steady_clock::now() + timeout;
    StampedFrame frame;
    for (auto now = steady_clock::now(); now < deadline;
         now = steady_clock::now()) {
        if (!frames_.wait_and_pop_for(frame, deadline - now)) {
            break;
        }
        // A read that started before the clear may still land afterwards
        if (frame.acquired >= clearedAt_) {
            return frame.image;
        }
    }
    return std::unexpected(std::make_error_code(std::errc::timed_out));
}

} // namespace fixcap_rt::camera
