#include "fixcap_rt/app.hpp"
#include "fixcap_rt/session/session.hpp"
#include "fixcap_rt/stages/csv_sample_writer.hpp"
#include "fixcap_rt/stages/h5_sample_writer.hpp"
#include "fixcap_rt/stimulus/target_renderer.hpp"
#include "fixcap_rt/trial/trial_runner.hpp"
#include <filesystem>
#include <fixcap/core/random.hpp>
#include <fixcap/core/utils.hpp>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace fixcap_rt {

namespace {

trial::TrialTiming makeTiming_(const config::SessionConfig &config) {
    using std::chrono::milliseconds;
    const auto &t = config.timing;
    return {
        .frame_interval = milliseconds(t.frame_interval_ms),
        .animation_tick = milliseconds(t.animation_tick_ms),
        .capture_window = milliseconds(t.capture_window_ms),
        .capture_tick = milliseconds(t.capture_tick_ms),
        .settle_delay = milliseconds(t.settle_delay_ms),
        .frame_timeout = milliseconds(config.camera.frame_timeout_ms),
    };
}

} // namespace

App::App(int argc, char **argv)
    : config_(config::ParseCommandLine(argc, argv)) {}

void App::Launch() {
    spdlog::set_level(spdlog::level::from_str(config_.log_level));

    const std::filesystem::path base_path(config_.base_path);
    std::error_code dir_ec;
    std::filesystem::create_directories(base_path, dir_ec);
    if (dir_ec) {
        throw std::runtime_error("Failed to create " + base_path.string() +
                                 ": " + dir_ec.message());
    }

    const auto session_uuid = fixcap::core::session_uuid();
    spdlog::info("Session {} writing to {}", session_uuid, base_path.string());

    broadcastManager_ = std::make_shared<managers::BroadcastManager>();
    if (!config_.broadcast_address.empty()) {
        if (auto ec = broadcastManager_->Bind(config_.broadcast_address)) {
            throw std::runtime_error("Failed to bind " +
                                     config_.broadcast_address + ": " +
                                     ec.message());
        }
        broadcastManager_->Spawn();
    }

    webcam_ = std::make_shared<camera::WebcamSource>(config_.camera);
    if (auto ec = webcam_->Open()) {
        throw std::runtime_error("Failed to open camera " +
                                 std::to_string(config_.camera.device_index) +
                                 ": " + ec.message());
    }
    webcam_->Spawn();

    graphicsManager_ = std::make_shared<managers::GraphicsManager>(
        config_.graphics, config_.quit_key);
    auto geometry = resolveMonitorGeometry_();
    spdlog::info("Using monitor of size {}x{}mm and {}x{}px",
                 geometry.width_mm, geometry.height_mm, geometry.width_px,
                 geometry.height_px);
    if (auto ec = graphicsManager_->Open(geometry)) {
        throw std::runtime_error("Failed to open stimulus window: " +
                                 ec.message());
    }

    std::vector<std::shared_ptr<fixcap::core::ISampleSink>> sinks;
    for (const auto &output : config_.outputs) {
        if (output == "csv") {
            sinks.push_back(std::make_shared<stages::CsvSampleWriter>(
                base_path / "data.csv"));
        } else if (output == "h5") {
            sinks.push_back(std::make_shared<stages::H5SampleWriter>(
                base_path / "data.h5", session_uuid, geometry));
        }
    }

    auto random = std::make_shared<fixcap::core::EngineRandomSource>(
        config_.seed);
    auto clock = std::make_shared<fixcap::core::SteadyClock>();
    auto renderer = std::make_shared<stimulus::TargetRenderer>(
        stimulus::TargetStyle{
            .glyph = config_.stimulus.glyph,
            .text_scale = config_.stimulus.text_scale,
            .text_thickness = config_.stimulus.text_thickness,
        },
        random);

    auto runner = std::make_shared<trial::TrialRunner>(
        base_path, cv::Size(geometry.width_px, geometry.height_px),
        makeTiming_(config_), config_.quit_key, renderer, random, clock);

    session::Session session(
        runner, graphicsManager_, webcam_, geometry, std::move(sinks), clock,
        std::chrono::milliseconds(config_.timing.inter_trial_delay_ms),
        config_.quit_key);

    if (broadcastManager_->IsRunning()) {
        runner->SetBroadcast(broadcastManager_, session_uuid);
        session.SetBroadcast(broadcastManager_, session_uuid);
    }

    auto result = session.Run();

    graphicsManager_->Shutdown();
    webcam_->Stop();
    broadcastManager_->Stop();

    if (!result) {
        throw std::runtime_error("Session failed: " +
                                 result.error().message());
    }
}

fixcap::core::MonitorGeometry App::resolveMonitorGeometry_() {
    if (config_.monitor_mm && config_.monitor_pixels) {
        return {
            .width_mm = (*config_.monitor_mm)[0],
            .height_mm = (*config_.monitor_mm)[1],
            .width_px = (*config_.monitor_pixels)[0],
            .height_px = (*config_.monitor_pixels)[1],
        };
    }

    graphicsManager_->Init();
    auto detected = graphicsManager_->GetMonitorGeometry();
    if (!detected) {
        throw std::runtime_error("Please supply monitor dimensions manually "
                                 "(--monitor_mm W,H --monitor_pixels W,H) as "
                                 "they could not be retrieved");
    }

    // A value given on the command line wins over the detected one
    if (config_.monitor_mm) {
        detected->width_mm = (*config_.monitor_mm)[0];
        detected->height_mm = (*config_.monitor_mm)[1];
    }
    if (config_.monitor_pixels) {
        detected->width_px = (*config_.monitor_pixels)[0];
        detected->height_px = (*config_.monitor_pixels)[1];
    }
    return detected.value();
}

App::~App() {}

} // namespace fixcap_rt
