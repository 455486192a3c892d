#pragma once

#include "fixcap_rt/managers/broadcast_manager.hpp"
#include "fixcap_rt/trial/trial_runner.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <fixcap/core/core.hpp>
#include <fixcap/core/interfaces.hpp>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace fixcap_rt::session {

struct SessionSummary {
    uint64_t captured{0};
    uint64_t expired{0};
};

// Runs trials back to back until the operator quits. Only captured trials
// reach the sinks.
class Session {
  public:
    Session(std::shared_ptr<trial::TrialRunner> runner,
            std::shared_ptr<trial::ITargetDisplay> display,
            std::shared_ptr<trial::ICameraSource> camera,
            fixcap::core::MonitorGeometry geometry,
            std::vector<std::shared_ptr<fixcap::core::ISampleSink>> sinks,
            std::shared_ptr<fixcap::core::IClock> clock,
            std::chrono::milliseconds inter_trial_delay, int quit_key);

    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    void SetBroadcast(std::shared_ptr<managers::BroadcastManager> &broadcast,
                      std::string session_uuid);

    // Quitting is a normal end; any other trial error is returned
    std::expected<SessionSummary, std::error_code> Run();

  private:
    void record_(const fixcap::core::TrialOutcome &outcome);
    void broadcast_(net::message::TrialEvent event);

    std::shared_ptr<trial::TrialRunner> runner_;
    std::shared_ptr<trial::ITargetDisplay> display_;
    std::shared_ptr<trial::ICameraSource> camera_;
    fixcap::core::MonitorGeometry geometry_;
    std::vector<std::shared_ptr<fixcap::core::ISampleSink>> sinks_;
    std::shared_ptr<fixcap::core::IClock> clock_;
    std::chrono::milliseconds interTrialDelay_;
    int quitKey_;

    std::weak_ptr<managers::BroadcastManager> broadcastManager_;
    std::string sessionUuid_;

    SessionSummary summary_;
};

} // namespace fixcap_rt::session
