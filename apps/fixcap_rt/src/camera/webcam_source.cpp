#include "fixcap_rt/camera/webcam_source.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace fixcap_rt::camera {

using namespace std::chrono;

WebcamSource::WebcamSource(const config::CameraSettings &settings)
    : settings_(settings), frames_(static_cast<size_t>(settings.queue_capacity)) {}

WebcamSource::~WebcamSource() { Stop(); }

std::error_code WebcamSource::Open() {
    if (!capture_.open(settings_.device_index)) {
        return std::make_error_code(std::errc::no_such_device);
    }

    if (settings_.width > 0) {
        capture_.set(cv::CAP_PROP_FRAME_WIDTH, settings_.width);
    }
    if (settings_.height > 0) {
        capture_.set(cv::CAP_PROP_FRAME_HEIGHT, settings_.height);
    }
    if (settings_.fps > 0) {
        capture_.set(cv::CAP_PROP_FPS, settings_.fps);
    }
    if (settings_.buffer_size > 0) {
        // Not every backend honours this; the clear mark covers the rest
        capture_.set(cv::CAP_PROP_BUFFERSIZE, settings_.buffer_size);
    }

    spdlog::info("Camera {} opened at {}x{} ({} fps, {} backend)",
                 settings_.device_index,
                 capture_.get(cv::CAP_PROP_FRAME_WIDTH),
                 capture_.get(cv::CAP_PROP_FRAME_HEIGHT),
                 capture_.get(cv::CAP_PROP_FPS), capture_.getBackendName());
    return {};
}

void WebcamSource::Init() { spdlog::debug("Camera reader started"); }

void WebcamSource::Run() {
    StampedFrame frame{steady_clock::now(), cv::Mat{}};
    if (!capture_.read(frame.image) || frame.image.empty()) {
        if (failedReads_++ == 0) {
            spdlog::warn("Camera {} returned no frame",
                         settings_.device_index);
        }
        std::this_thread::sleep_for(milliseconds(10));
        return;
    }
    if (failedReads_ != 0) {
        spdlog::info("Camera {} recovered after {} failed reads",
                     settings_.device_index, failedReads_);
        failedReads_ = 0;
    }
    frames_.push(std::move(frame));
}

void WebcamSource::Shutdown() {
    capture_.release();
    spdlog::info("Camera {} released ({} frames dropped)",
                 settings_.device_index, frames_.dropped());
}

void WebcamSource::clearBuffer() { frames_.clear(); }

std::expected<cv::Mat, std::error_code>
WebcamSource::nextFrame(milliseconds timeout) {
    if (!IsRunning()) {
        return std::unexpected(std::make_error_code(std::errc::not_connected));
    }
    return frames_.next(timeout);
}

} // namespace fixcap_rt::camera
