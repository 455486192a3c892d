#pragma once

#include "detail/socket_base.hpp"
#include <atomic>
#include <cstddef>
#include <string>
#include <system_error>

namespace fixcap_rt::net {

// Listening PUB socket for trial events. Keeps its own count of connected
// subscribers so publishing can skip serialization work nobody will read.
class PublishSocket {
public:
    PublishSocket() = default;
    ~PublishSocket();

    // Opens the socket and starts listening on address
    std::error_code Open(const std::string& address);

    // Never blocks; with no subscribers the message is dropped
    std::error_code Publish(const std::string& data);

    size_t Subscribers() const {
        return subscribers_.load(std::memory_order_relaxed);
    }

    void Close();

private:
    std::atomic<size_t> subscribers_{0};
    detail::SocketBase base_;
};

} // namespace fixcap_rt::net
