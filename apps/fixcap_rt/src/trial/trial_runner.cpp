#include "fixcap_rt/trial/trial_runner.hpp"
#include "fixcap_rt/stimulus/orientation.hpp"
#include <algorithm>
#include <fixcap/core/utils.hpp>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace fixcap_rt::trial {

using fixcap::core::TrialOutcome;
using namespace std::chrono;

std::error_code HoldFrame(ITargetDisplay &display,
                          const fixcap::core::IClock &clock,
                          milliseconds duration, milliseconds tick,
                          int quit_key) {
    const auto deadline = clock.now() + duration;
    for (auto now = clock.now(); now < deadline; now = clock.now()) {
        auto remaining = std::chrono::ceil<milliseconds>(deadline - now);
        auto key = display.waitKey(std::min(tick, remaining));
        if (key && *key == quit_key) {
            return std::make_error_code(std::errc::operation_canceled);
        }
    }
    return {};
}

TrialRunner::TrialRunner(std::filesystem::path base_path, cv::Size screen,
                         TrialTiming timing, int quit_key,
                         std::shared_ptr<stimulus::TargetRenderer> renderer,
                         std::shared_ptr<fixcap::core::IRandomSource> random,
                         std::shared_ptr<fixcap::core::IClock> clock)
    : basePath_(std::move(base_path)), screen_(screen), timing_(timing),
      quitKey_(quit_key), blank_(cv::Mat::zeros(screen, CV_32FC3)),
      renderer_(std::move(renderer)), random_(std::move(random)),
      clock_(std::move(clock)) {
    if (!renderer_ || !random_ || !clock_) {
        throw std::invalid_argument("TrialRunner requires a renderer, random "
                                    "source and clock");
    }
    if (screen_.width <= 0 || screen_.height <= 0) {
        throw std::invalid_argument("TrialRunner requires a non-empty screen");
    }
}

void TrialRunner::SetOutcomeCallback(outcome_cb_t callback) {
    outcomeCallback_ = std::move(callback);
}

void TrialRunner::SetBroadcast(
    std::shared_ptr<managers::BroadcastManager> &broadcast,
    std::string session_uuid) {
    broadcastManager_ = broadcast;
    sessionUuid_ = std::move(session_uuid);
}

TrialSetup TrialRunner::Setup() {
    auto sample = [this](int extent) {
        int v = static_cast<int>(random_->uniform(0.0, 1.0) * extent);
        return std::clamp(v, 0, extent - 1);
    };
    int x = sample(screen_.width);
    int y = sample(screen_.height);
    auto orientation = stimulus::OrientationFromIndex(
        random_->uniformInt(0, fixcap::core::kOrientationCount - 1));
    return {cv::Point{x, y}, orientation};
}

std::expected<TrialOutcome, std::error_code>
TrialRunner::Run(ITargetDisplay &display, ICameraSource &camera) {
    return Run(display, camera, Setup());
}

std::expected<TrialOutcome, std::error_code>
TrialRunner::Run(ITargetDisplay &display, ICameraSource &camera,
                 const TrialSetup &setup) {
    TrialOutcome outcome{
        .file_name = std::nullopt,
        .point_on_screen = {setup.center.x, setup.center.y},
        .time_till_capture = std::nullopt,
    };

    const int confirmKey = stimulus::ConfirmationKey(setup.orientation);
    double shrink = 1.0;
    int frames = 0;
    State state = State::ANIMATING;
    steady_clock::time_point windowOpen{};
    std::string captureName;

    spdlog::debug("Trial {}: target at ({}, {}) facing {}", trialIndex_,
                  setup.center.x, setup.center.y,
                  fixcap::core::to_string(setup.orientation));
    broadcast_(net::message::TrialEvent::TRIAL_START, setup, outcome);

    while (state != State::DONE) {
        switch (state) {
        case State::ANIMATING: {
            auto result = renderer_->Render(screen_, setup.center, shrink,
                                            setup.orientation);
            display.present(result.frame);
            ++frames;
            if (auto ec = HoldFrame(display, *clock_, timing_.frame_interval,
                                    timing_.animation_tick, quitKey_)) {
                return std::unexpected(ec);
            }
            shrink = result.next_shrink_factor;
            if (result.terminated) {
                captureName = fixcap::core::timestamp_name(
                                  system_clock::now()) +
                              ".jpg";
                windowOpen = clock_->now();
                spdlog::debug("Trial {}: cue after {} frames", trialIndex_,
                              frames);
                broadcast_(net::message::TrialEvent::CUE, setup, outcome);
                state = State::CAPTURE_WINDOW;
            }
            break;
        }
        case State::CAPTURE_WINDOW: {
            auto elapsed = clock_->now() - windowOpen;
            if (elapsed >= timing_.capture_window) {
                state = State::EXPIRED;
                break;
            }
            auto remaining =
                std::chrono::ceil<milliseconds>(timing_.capture_window - elapsed);
            auto key = display.waitKey(std::min(timing_.capture_tick, remaining));
            if (!key) {
                break;
            }
            if (*key == quitKey_) {
                return std::unexpected(
                    std::make_error_code(std::errc::operation_canceled));
            }
            if (*key != confirmKey) {
                spdlog::debug("Trial {}: ignoring key {}", trialIndex_, *key);
                break;
            }
            // Latency is fixed by the key press, not by camera delivery
            auto latency = fixcap::core::to_seconds(clock_->now() - windowOpen);
            state = capture_(camera, captureName, latency, outcome)
                        ? State::CAPTURED
                        : State::EXPIRED;
            break;
        }
        case State::CAPTURED:
        case State::EXPIRED: {
            if (state == State::CAPTURED) {
                spdlog::info("Trial {}: captured {} after {:.3f}s",
                             trialIndex_, *outcome.file_name,
                             *outcome.time_till_capture);
                broadcast_(net::message::TrialEvent::CAPTURED, setup, outcome);
            } else {
                spdlog::info("Trial {}: expired", trialIndex_);
                broadcast_(net::message::TrialEvent::EXPIRED, setup, outcome);
            }
            if (outcomeCallback_) {
                outcomeCallback_(outcome);
            }
            display.present(blank_);
            if (auto ec = HoldFrame(display, *clock_, timing_.settle_delay,
                                    timing_.animation_tick, quitKey_)) {
                return std::unexpected(ec);
            }
            state = State::DONE;
            break;
        }
        case State::DONE:
            break;
        }
    }

    ++trialIndex_;
    return outcome;
}

bool TrialRunner::capture_(ICameraSource &camera, const std::string &file_name,
                           double latency, TrialOutcome &outcome) {
    camera.clearBuffer();
    auto frame = camera.nextFrame(timing_.frame_timeout);
    if (!frame) {
        spdlog::error("Trial {}: no camera frame: {}", trialIndex_,
                      frame.error().message());
        return false;
    }
    auto path = basePath_ / file_name;
    try {
        if (!cv::imwrite(path.string(), frame.value())) {
            spdlog::error("Trial {}: failed to write {}", trialIndex_,
                          path.string());
            return false;
        }
    } catch (const cv::Exception &e) {
        spdlog::error("Trial {}: failed to write {}: {}", trialIndex_,
                      path.string(), e.what());
        return false;
    }

    outcome.file_name = file_name;
    outcome.time_till_capture = latency;
    return true;
}

void TrialRunner::broadcast_(net::message::TrialEvent event,
                             const TrialSetup &setup,
                             const TrialOutcome &outcome) {
    auto broadcast = broadcastManager_.lock();
    if (!broadcast) {
        return;
    }
    net::message::TrialEventMessage message{
        .session_uuid = sessionUuid_,
        .event = event,
        .trial_index = trialIndex_,
        .timestamp_us = fixcap::core::steady_micros(),
        .point_on_screen = outcome.point_on_screen,
        .orientation = setup.orientation,
        .file_name = outcome.file_name,
        .time_till_capture = outcome.time_till_capture,
    };
    if (auto ec =
            broadcast->Broadcast(net::message::BroadcastTopic::TRIAL, message)) {
        spdlog::debug("Trial {}: event not broadcast: {}", trialIndex_,
                      ec.message());
    }
}

} // namespace fixcap_rt::trial
