#pragma once

#include "linkgate/common/noncopyable.h"
#include "linkgate/network/Socket.h"
#include "linkgate/network/Channel.h"
#include "linkgate/network/InetAddress.h"

#include <functional>

namespace linkgate {
namespace network {

class EventLoop;

class Acceptor : linkgate::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    bool Listening() const { return listening_; }
    void Listen();

    // Actual bound address; differs from the requested one when port 0 was used.
    InetAddress ListenAddress() const { return accept_socket_.LocalAddress(); }

private:
    void HandleRead();

    EventLoop* loop_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool listening_;
    int idle_fd_; // spare fd to shed connections on EMFILE
};

} // namespace network
} // namespace linkgate
