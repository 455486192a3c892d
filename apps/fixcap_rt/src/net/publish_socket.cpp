#include "fixcap_rt/net/publish_socket.hpp"
#include <spdlog/spdlog.h>

namespace fixcap_rt::net {

std::error_code PublishSocket::Open(const std::string& address) {
    if (auto ec = base_.Init(detail::SocketType::PUB)) {
        return ec;
    }

    base_.RegisterConnectCallback([this](uint32_t id) {
        subscribers_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("Subscriber {} connected", id);
    });
    base_.RegisterDisconnectCallback([this](uint32_t id) {
        subscribers_.fetch_sub(1, std::memory_order_relaxed);
        spdlog::debug("Subscriber {} disconnected", id);
    });

    if (auto ec = base_.Bind(address)) {
        base_.Close();
        return ec;
    }
    return {};
}

std::error_code PublishSocket::Publish(const std::string& data) {
    if (Subscribers() == 0) {
        return {};
    }
    return base_.Send(data);
}

void PublishSocket::Close() {
    base_.Close();
    subscribers_.store(0, std::memory_order_relaxed);
}

PublishSocket::~PublishSocket() { Close(); }

} // namespace fixcap_rt::net
