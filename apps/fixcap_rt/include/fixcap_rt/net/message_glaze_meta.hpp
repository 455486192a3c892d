#pragma once
#include "fixcap_rt/net/message_types.hpp"
#include <fixcap/core/core.hpp>
#include <glaze/glaze.hpp>

template <> struct glz::meta<fixcap::core::Orientation> {
    using enum fixcap::core::Orientation;
    static constexpr auto value = glz::enumerate(UP, DOWN, LEFT, RIGHT);
};

template <> struct glz::meta<fixcap_rt::net::message::BroadcastTopic> {
    using enum fixcap_rt::net::message::BroadcastTopic;
    static constexpr auto value = glz::enumerate(TRIAL);
};

template <> struct glz::meta<fixcap_rt::net::message::TrialEvent> {
    using enum fixcap_rt::net::message::TrialEvent;
    static constexpr auto value = glz::enumerate(SESSION_START, TRIAL_START,
                                                 CUE, CAPTURED, EXPIRED,
                                                 SESSION_END);
};
