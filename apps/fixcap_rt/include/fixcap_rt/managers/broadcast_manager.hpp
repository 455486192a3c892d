#pragma once

#include "fixcap_rt/net/message_glaze_meta.hpp"
#include "fixcap_rt/net/message_types.hpp"
#include "fixcap_rt/net/publish_socket.hpp"
#include "fixcap_rt/threading/thread.hpp"
#include <fixcap/core/queue.hpp>
#include <glaze/json/write.hpp>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>

namespace fixcap_rt::managers {

// Publishes JSON {topic, payload} messages on an nng PUB socket from its own
// thread so callers on the trial thread never wait on the network.
class BroadcastManager : public threading::Thread<BroadcastManager> {
  public:
    BroadcastManager();

    // Opens and binds the socket; call before Spawn()
    std::error_code Bind(const std::string &address);

    void Init();
    void Shutdown();
    void Run();

    // Broadcast a message to all subscribers
    void Broadcast(const net::message::BroadcastMessage &message);

    // Serialize payload
    template<typename T>
    std::error_code Broadcast(const net::message::BroadcastTopic &topic, const T& payload) {
        net::message::BroadcastMessage message;
        {
            std::lock_guard<std::mutex> lock(payloadMutex_);
            if (auto ec = glz::write_json(payload, payload_buffer_)) {
                spdlog::warn("Failed to serialize broadcast message: {}", glz::format_error(ec));
                return std::make_error_code(std::errc::bad_message);
            }
            message.payload = payload_buffer_;
        }

        message.topic = topic;
        Broadcast(message);

        return {};
    }

    size_t GetSubscriberCount() const;

    ~BroadcastManager();

  private:
    net::PublishSocket pub_;
    std::string send_buffer_;
    std::mutex payloadMutex_;
    std::string payload_buffer_;
    fixcap::core::Queue<net::message::BroadcastMessage> message_queue_;
};

} // namespace fixcap_rt::managers
