#include "fixcap_rt/session/session.hpp"
#include <fixcap/core/utils.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace fixcap_rt::session {

Session::Session(std::shared_ptr<trial::TrialRunner> runner,
                 std::shared_ptr<trial::ITargetDisplay> display,
                 std::shared_ptr<trial::ICameraSource> camera,
                 fixcap::core::MonitorGeometry geometry,
                 std::vector<std::shared_ptr<fixcap::core::ISampleSink>> sinks,
                 std::shared_ptr<fixcap::core::IClock> clock,
                 std::chrono::milliseconds inter_trial_delay, int quit_key)
    : runner_(std::move(runner)), display_(std::move(display)),
      camera_(std::move(camera)), geometry_(geometry),
      sinks_(std::move(sinks)), clock_(std::move(clock)),
      interTrialDelay_(inter_trial_delay), quitKey_(quit_key) {
    if (!runner_ || !display_ || !camera_ || !clock_) {
        throw std::invalid_argument(
            "Session requires a runner, display, camera and clock");
    }
    runner_->SetOutcomeCallback(
        [this](const fixcap::core::TrialOutcome &outcome) { record_(outcome); });
}

Session::~Session() { runner_->SetOutcomeCallback(nullptr); }

void Session::SetBroadcast(
    std::shared_ptr<managers::BroadcastManager> &broadcast,
    std::string session_uuid) {
    broadcastManager_ = broadcast;
    sessionUuid_ = std::move(session_uuid);
}

std::expected<SessionSummary, std::error_code> Session::Run() {
    spdlog::info("Session started on {}x{} px ({}x{} mm)", geometry_.width_px,
                 geometry_.height_px, geometry_.width_mm, geometry_.height_mm);
    broadcast_(net::message::TrialEvent::SESSION_START);

    std::error_code stop;
    while (!stop) {
        // Outcomes are recorded through the runner's callback
        auto outcome = runner_->Run(*display_, *camera_);
        if (!outcome) {
            stop = outcome.error();
            break;
        }

        stop = trial::HoldFrame(*display_, *clock_, interTrialDelay_,
                                runner_->GetTiming().animation_tick, quitKey_);
    }

    broadcast_(net::message::TrialEvent::SESSION_END);
    spdlog::info("Session finished: {} captured, {} expired",
                 summary_.captured, summary_.expired);

    if (stop == std::errc::operation_canceled) {
        return summary_;
    }
    spdlog::error("Session aborted: {}", stop.message());
    return std::unexpected(stop);
}

void Session::record_(const fixcap::core::TrialOutcome &outcome) {
    if (!outcome.captured()) {
        ++summary_.expired;
        return;
    }
    ++summary_.captured;

    fixcap::core::Sample sample{
        .file_name = outcome.file_name.value(),
        .point_on_screen = outcome.point_on_screen,
        .time_till_capture = outcome.time_till_capture.value(),
        .monitor_mm = geometry_.mm(),
        .monitor_pixels = geometry_.pixels(),
    };
    for (auto &sink : sinks_) {
        sink->consume(sample);
    }
}

void Session::broadcast_(net::message::TrialEvent event) {
    auto broadcast = broadcastManager_.lock();
    if (!broadcast) {
        return;
    }
    net::message::TrialEventMessage message{
        .session_uuid = sessionUuid_,
        .event = event,
        .trial_index = runner_->GetTrialCount(),
        .timestamp_us = fixcap::core::steady_micros(),
    };
    if (auto ec =
            broadcast->Broadcast(net::message::BroadcastTopic::TRIAL, message)) {
        spdlog::warn("Failed to send broadcast message: {}", ec.message());
    }
}

} // namespace fixcap_rt::session
