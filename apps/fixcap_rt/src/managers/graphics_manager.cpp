#include "fixcap_rt/managers/graphics_manager.hpp"
#include <cstdarg>
#include <cstdio>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <thread>

namespace fixcap_rt::managers {

using namespace std::chrono;

namespace {

// Expands a raylib printf-style trace message
std::string formatTrace_(const char *fmt, va_list args) {
    char stack[256];
    va_list retry;
    va_copy(retry, args);
    int size = std::vsnprintf(stack, sizeof(stack), fmt, args);
    if (size < 0) {
        va_end(retry);
        return {};
    }
    if (static_cast<size_t>(size) < sizeof(stack)) {
        va_end(retry);
        return std::string(stack, size);
    }
    std::string message(size, '\0');
    std::vsnprintf(message.data(), message.size() + 1, fmt, retry);
    va_end(retry);
    return message;
}

} // namespace

GraphicsManager::GraphicsManager(const config::GraphicsSettings &settings,
                                 int quit_key)
    : settings_(settings), quitKey_(quit_key) {
    SetTraceLogCallback(&GraphicsManager::errorCallback_);
    SetTraceLogLevel(LOG_WARNING);
}

GraphicsManager::~GraphicsManager() { Shutdown(); }

void GraphicsManager::Init() {
    state_.store(State::DEFAULT, std::memory_order_release);

    // raylib needs a window context to query monitor information
    SetConfigFlags(FLAG_WINDOW_HIDDEN);
    InitWindow(0, 0, "");
    pollMonitors_();
    CloseWindow();
}

void GraphicsManager::errorCallback_(int err, const char *fmt, va_list args) {
    auto message = formatTrace_(fmt, args);
    switch (err) {
    case TraceLogLevel::LOG_TRACE:
        spdlog::trace(message);
        break;
    case TraceLogLevel::LOG_DEBUG:
        spdlog::debug(message);
        break;
    case TraceLogLevel::LOG_INFO:
        spdlog::info(message);
        break;
    case TraceLogLevel::LOG_WARNING:
        spdlog::warn(message);
        break;
    case TraceLogLevel::LOG_ERROR:
    case TraceLogLevel::LOG_FATAL:
        spdlog::error(message);
        break;
    default:
        break;
    }
}

std::error_code
GraphicsManager::Open(const fixcap::core::MonitorGeometry &geometry) {
    if (state_.load(std::memory_order_acquire) != State::DEFAULT) {
        return std::make_error_code(std::errc::operation_not_permitted);
    }

    unsigned int flags = FLAG_WINDOW_UNDECORATED | FLAG_WINDOW_TOPMOST;
    if (settings_.vsync)
        flags |= FLAG_VSYNC_HINT;
    SetConfigFlags(flags);
    SetTargetFPS(settings_.target_fps);

    InitWindow(geometry.width_px, geometry.height_px, "fixcap");
    if (!IsWindowReady()) {
        return std::make_error_code(std::errc::io_error);
    }
    // The detection window's hidden flag outlives CloseWindow()
    ClearWindowState(FLAG_WINDOW_HIDDEN);
    SetWindowMonitor(monitorIndex_);
    auto origin = GetMonitorPosition(monitorIndex_);
    SetWindowPosition(static_cast<int>(origin.x), static_cast<int>(origin.y));
    SetWindowFocused();
    HideCursor();

    Image blank = GenImageColor(geometry.width_px, geometry.height_px, BLACK);
    texture_ = LoadTextureFromImage(blank);
    UnloadImage(blank);
    if (texture_.id == 0) {
        CloseWindow();
        return std::make_error_code(std::errc::not_enough_memory);
    }

    state_.store(State::READY, std::memory_order_release);
    spdlog::info("Graphics initialized: {}x{} on monitor {} @ {}fps",
                 geometry.width_px, geometry.height_px, monitorIndex_,
                 settings_.target_fps);
    return {};
}

void GraphicsManager::Shutdown() {
    if (state_.exchange(State::DEFAULT, std::memory_order_acq_rel) !=
        State::READY) {
        return;
    }
    UnloadTexture(texture_);
    texture_ = Texture2D{};
    if (IsWindowReady()) {
        CloseWindow();
    }
    spdlog::info("Graphics shut down");
}

void GraphicsManager::present(const cv::Mat &frame) {
    if (state_.load(std::memory_order_acquire) != State::READY) {
        return;
    }

    cv::Mat bgr;
    frame.convertTo(bgr, CV_8UC3, frame.depth() == CV_32F ? 255.0 : 1.0);
    if (bgr.cols != texture_.width || bgr.rows != texture_.height) {
        cv::resize(bgr, bgr, cv::Size(texture_.width, texture_.height));
    }
    cv::cvtColor(bgr, rgba_, cv::COLOR_BGR2RGBA);
    UpdateTexture(texture_, rgba_.data);
    draw_();
}

std::optional<int> GraphicsManager::waitKey(milliseconds timeout) {
    if (state_.load(std::memory_order_acquire) != State::READY) {
        std::this_thread::sleep_for(timeout);
        return std::nullopt;
    }

    const auto deadline = steady_clock::now() + timeout;
    do {
        // EndDrawing() polls input and paces to the target frame rate
        draw_();
        if (WindowShouldClose()) {
            return quitKey_;
        }
        if (int key = GetKeyPressed(); key != KEY_NULL) {
            return key;
        }
    } while (steady_clock::now() < deadline);
    return std::nullopt;
}

void GraphicsManager::draw_() {
    BeginDrawing();
    ClearBackground(BLACK);
    DrawTexture(texture_, 0, 0, WHITE);
    EndDrawing();
}

std::optional<fixcap::core::MonitorGeometry>
GraphicsManager::GetMonitorGeometry() const {
    if (monitorIndex_ < 0 ||
        monitorIndex_ >= static_cast<int>(monitors_.size())) {
        return std::nullopt;
    }
    const auto &monitor = monitors_[monitorIndex_];
    fixcap::core::MonitorGeometry geometry{
        .width_mm = monitor.width_mm,
        .height_mm = monitor.height_mm,
        .width_px = monitor.width_px,
        .height_px = monitor.height_px,
    };
    if (!geometry.valid()) {
        return std::nullopt;
    }
    return geometry;
}

void GraphicsManager::pollMonitors_() {
    monitors_.clear();
    auto count = GetMonitorCount();

    for (auto i = 0; i < count; i++) {
        const char *name = GetMonitorName(i);
        monitors_.push_back(MonitorInfo{
            i, GetMonitorWidth(i), GetMonitorHeight(i),
            GetMonitorPhysicalWidth(i), GetMonitorPhysicalHeight(i),
            GetMonitorRefreshRate(i), name ? name : ""});
        spdlog::debug("Monitor {} \"{}\": {}x{} px, {}x{} mm", i,
                      monitors_.back().name, monitors_.back().width_px,
                      monitors_.back().height_px, monitors_.back().width_mm,
                      monitors_.back().height_mm);
    }
}

} // namespace fixcap_rt::managers
