#pragma once

#include <cstdint>
#include <functional>
#include <nng/nng.h>
#include <string>
#include <system_error>

namespace fixcap_rt::net::detail {

// Socket type determines which NNG protocol to use
enum class SocketType {
    PUB,  // Publish (server-side PUB/SUB)
};

// Shared NNG socket implementation
class SocketBase {
public:
    using pipe_cb_t = std::function<void(uint32_t)>;

    SocketBase();
    ~SocketBase();

    // Non-copyable, non-movable (manages NNG socket lifecycle)
    SocketBase(const SocketBase&) = delete;
    SocketBase& operator=(const SocketBase&) = delete;
    SocketBase(SocketBase&&) = delete;
    SocketBase& operator=(SocketBase&&) = delete;

    // Initialize socket with specified type
    std::error_code Init(SocketType type);

    // Bind to address (server-side)
    std::error_code Bind(const std::string& address);

    // Send message without blocking
    std::error_code Send(const std::string& data);

    // Close socket
    void Close();

    void RegisterConnectCallback(pipe_cb_t callback);
    void RegisterDisconnectCallback(pipe_cb_t callback);

private:
    static void handlePipeNotify_(nng_pipe pipe, nng_pipe_ev event, void* user_data);

    nng_socket socket_ = NNG_SOCKET_INITIALIZER;
    nng_listener listener_ = NNG_LISTENER_INITIALIZER;
    bool is_open_ = false;
    pipe_cb_t connect_cb_;
    pipe_cb_t disconnect_cb_;
};

// Error category for NNG
class nng_error_category : public std::error_category {
public:
    const char* name() const noexcept override {
        return "nng";
    }

    std::string message(int ev) const override {
        return nng_strerror(ev);
    }
};

inline const std::error_category& nng_category() {
    static nng_error_category instance;
    return instance;
}

inline std::error_code make_error_code(int nng_errno) {
    return std::error_code(nng_errno, nng_category());
}

} // namespace fixcap_rt::net::detail
