#include "fixcap_rt/net/detail/socket_base.hpp"
#include <nng/nng.h>
#include <nng/protocol/pubsub0/pub.h>
#include <spdlog/spdlog.h>

namespace fixcap_rt::net::detail {

SocketBase::SocketBase() = default;

SocketBase::~SocketBase() { Close(); }

std::error_code SocketBase::Init(SocketType type) {
    int ret = 0;

    switch (type) {
    case SocketType::PUB:
        ret = nng_pub0_open(&socket_);
        break;
    }

    if (ret != 0) {
        spdlog::error("Failed to open socket: {}", nng_strerror(ret));
        return make_error_code(ret);
    }

    // Register callbacks for connect and disconnect
    nng_pipe_notify(socket_, NNG_PIPE_EV_ADD_POST, &SocketBase::handlePipeNotify_, this);
    nng_pipe_notify(socket_, NNG_PIPE_EV_REM_POST, &SocketBase::handlePipeNotify_, this);

    is_open_ = true;
    return {};
}

std::error_code SocketBase::Bind(const std::string &address) {
    if (!is_open_) {
        return make_error_code(NNG_ECLOSED);
    }

    int ret = nng_listen(socket_, address.c_str(), &listener_, 0);
    if (ret != 0) {
        return make_error_code(ret);
    }

    return {};
}

std::error_code SocketBase::Send(const std::string &data) {
    if (!is_open_) {
        return make_error_code(NNG_ECLOSED);
    }

    nng_msg *msg = nullptr;
    int ret = nng_msg_alloc(&msg, 0);
    if (ret != 0) {
        return make_error_code(ret);
    }

    ret = nng_msg_append(msg, static_cast<const void *>(data.data()),
                         data.size());
    if (ret != 0) {
        nng_msg_free(msg);
        return make_error_code(ret);
    }

    // nng_sendmsg takes ownership of the message only on success
    ret = nng_sendmsg(socket_, msg, NNG_FLAG_NONBLOCK);
    if (ret != 0) {
        nng_msg_free(msg);
        return make_error_code(ret);
    }

    return {};
}

void SocketBase::Close() {
    if (listener_.id != 0) {
        nng_listener_close(listener_);
        listener_ = NNG_LISTENER_INITIALIZER;
    }

    if (is_open_) {
        nng_socket_close(socket_);
        socket_ = NNG_SOCKET_INITIALIZER;
        is_open_ = false;
    }
}

void SocketBase::RegisterConnectCallback(SocketBase::pipe_cb_t callback) {
    connect_cb_ = std::move(callback);
}

void SocketBase::RegisterDisconnectCallback(SocketBase::pipe_cb_t callback) {
    disconnect_cb_ = std::move(callback);
}

void SocketBase::handlePipeNotify_(nng_pipe pipe, nng_pipe_ev event, void *user_data) {
    auto self = static_cast<SocketBase *>(user_data);

    switch (event) {
        case NNG_PIPE_EV_ADD_POST:
            if (self->connect_cb_) {
                self->connect_cb_(nng_pipe_id(pipe));
            }
            break;
        case NNG_PIPE_EV_REM_POST:
            if (self->disconnect_cb_) {
                self->disconnect_cb_(nng_pipe_id(pipe));
            }
            break;
        default:
            break;
    }
}

} // namespace fixcap_rt::net::detail
