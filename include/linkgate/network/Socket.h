#pragma once

#include "linkgate/common/noncopyable.h"

namespace linkgate {
namespace network {

class InetAddress;

// Owns a socket fd and closes it on destruction.
class Socket : linkgate::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    // Throws std::system_error when the address cannot be bound.
    void BindAddress(const InetAddress& localaddr);
    void Listen();
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

    InetAddress LocalAddress() const;

private:
    const int sockfd_;
};

} // namespace network
} // namespace linkgate
