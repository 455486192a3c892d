#pragma once

#include "fixcap_rt/managers/broadcast_manager.hpp"
#include "fixcap_rt/net/message_types.hpp"
#include "fixcap_rt/stimulus/target_renderer.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <fixcap/core/core.hpp>
#include <fixcap/core/interfaces.hpp>
#include <fixcap/core/random.hpp>
#include <memory>
#include <opencv2/core.hpp>
#include <string>
#include <system_error>

namespace fixcap_rt::trial {

using ICameraSource = fixcap::core::IFrameSource<cv::Mat>;
using ITargetDisplay = fixcap::core::IDisplay<cv::Mat>;

struct TrialTiming {
    std::chrono::milliseconds frame_interval{500};
    std::chrono::milliseconds animation_tick{50};
    std::chrono::milliseconds capture_window{500};
    std::chrono::milliseconds capture_tick{42};
    std::chrono::milliseconds settle_delay{500};
    std::chrono::milliseconds frame_timeout{1000};
};

struct TrialSetup {
    cv::Point center;
    fixcap::core::Orientation orientation;
};

// Keeps the current frame up for duration, polling input every tick.
// Returns operation_canceled if quit_key was pressed.
std::error_code HoldFrame(ITargetDisplay &display,
                          const fixcap::core::IClock &clock,
                          std::chrono::milliseconds duration,
                          std::chrono::milliseconds tick, int quit_key);

class TrialRunner {
  public:
    enum class State : uint8_t {
        ANIMATING,
        CAPTURE_WINDOW,
        CAPTURED,
        EXPIRED,
        DONE,
    };

    TrialRunner(std::filesystem::path base_path, cv::Size screen,
                TrialTiming timing, int quit_key,
                std::shared_ptr<stimulus::TargetRenderer> renderer,
                std::shared_ptr<fixcap::core::IRandomSource> random,
                std::shared_ptr<fixcap::core::IClock> clock);

    using outcome_cb_t = std::function<void(const fixcap::core::TrialOutcome &)>;

    // Called once per finished trial, before the settle delay, so an outcome
    // is kept even if the operator quits while the blank frame is up
    void SetOutcomeCallback(outcome_cb_t callback);

    // Trial events are published here when set
    void SetBroadcast(std::shared_ptr<managers::BroadcastManager> &broadcast,
                      std::string session_uuid);

    // Uniform center in [0, W) x [0, H) and a uniform orientation
    TrialSetup Setup();

    // operation_canceled means the operator asked to quit. A trial quit during
    // its settle delay has already reached the outcome callback.
    std::expected<fixcap::core::TrialOutcome, std::error_code>
    Run(ITargetDisplay &display, ICameraSource &camera);

    std::expected<fixcap::core::TrialOutcome, std::error_code>
    Run(ITargetDisplay &display, ICameraSource &camera,
        const TrialSetup &setup);

    uint64_t GetTrialCount() const { return trialIndex_; }
    const TrialTiming &GetTiming() const { return timing_; }

  private:
    // Pulls a fresh frame and writes it; false leaves the trial uncaptured.
    // latency is the time from window open to the accepted key press.
    bool capture_(ICameraSource &camera, const std::string &file_name,
                  double latency, fixcap::core::TrialOutcome &outcome);

    void broadcast_(net::message::TrialEvent event, const TrialSetup &setup,
                    const fixcap::core::TrialOutcome &outcome);

    std::filesystem::path basePath_;
    cv::Size screen_;
    TrialTiming timing_;
    int quitKey_;
    cv::Mat blank_;

    std::shared_ptr<stimulus::TargetRenderer> renderer_;
    std::shared_ptr<fixcap::core::IRandomSource> random_;
    std::shared_ptr<fixcap::core::IClock> clock_;

    outcome_cb_t outcomeCallback_;
    std::weak_ptr<managers::BroadcastManager> broadcastManager_;
    std::string sessionUuid_;
    uint64_t trialIndex_{0};
};

} // namespace fixcap_rt::trial
