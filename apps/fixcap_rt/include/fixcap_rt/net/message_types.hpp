#pragma once
#include <cstdint>
#include <fixcap/core/core.hpp>
#include <optional>
#include <string>

namespace fixcap_rt::net::message {

enum class BroadcastTopic : uint8_t {
    TRIAL = 0,
};

enum class TrialEvent : uint8_t {
    SESSION_START = 0,
    TRIAL_START = 1,
    CUE = 2,
    CAPTURED = 3,
    EXPIRED = 4,
    SESSION_END = 5,
};

struct TrialEventMessage {
    std::string session_uuid{};
    TrialEvent event{};
    uint64_t trial_index{};
    uint64_t timestamp_us{};
    fixcap::vec2<int> point_on_screen{};
    fixcap::core::Orientation orientation{};
    std::optional<std::string> file_name{};
    std::optional<double> time_till_capture{};
};

struct BroadcastMessage {
    BroadcastTopic topic;
    std::string payload;
};

} // namespace fixcap_rt::net::message
