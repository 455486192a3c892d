#include "fixcap_rt/managers/broadcast_manager.hpp"
#include "fixcap_rt/net/message_glaze_meta.hpp"
#include "fixcap_rt/net/message_types.hpp"
#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>

#include <system_error>

namespace fixcap_rt::managers {

BroadcastManager::BroadcastManager() {}

BroadcastManager::~BroadcastManager() { Stop(); }

std::error_code BroadcastManager::Bind(const std::string &address) {
    if (auto ec = pub_.Open(address)) {
        spdlog::error("Failed to bind broadcast socket to {}: {}", address,
                      ec.message());
        return ec;
    }
    spdlog::info("BroadcastManager bound to {}", address);
    return {};
}

void BroadcastManager::Init() {}

void BroadcastManager::Shutdown() {
    // Drain what the session queued before it stopped us
    while (auto msg = message_queue_.try_pop()) {
        if (auto ec = glz::write_json(msg.value(), send_buffer_)) {
            spdlog::warn("Failed to serialize broadcast message: {}",
                         glz::format_error(ec));
            continue;
        }
        if (auto ec = pub_.Publish(send_buffer_)) {
            spdlog::debug("Dropped broadcast message at shutdown: {}",
                          ec.message());
        }
    }
    pub_.Close();
    spdlog::info("BroadcastManager shut down");
}

void BroadcastManager::Run() {
    net::message::BroadcastMessage msg;
    if (!message_queue_.wait_and_pop(msg, get_stop_token())) {
        return; // Thread stopped
    }
    if (auto ec = glz::write_json(msg, send_buffer_)) {
        spdlog::warn("Failed to serialize broadcast message: {}",
                     glz::format_error(ec));
        return;
    }
    if (auto ec = pub_.Publish(send_buffer_)) {
        spdlog::warn("Failed to publish broadcast message: {}", ec.message());
    }
}

void BroadcastManager::Broadcast(
    const net::message::BroadcastMessage &message) {
    message_queue_.push(message);
}

size_t BroadcastManager::GetSubscriberCount() const {
    return pub_.Subscribers();
}

} // namespace fixcap_rt::managers
