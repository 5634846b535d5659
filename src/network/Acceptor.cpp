#include "linkgate/network/Acceptor.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace linkgate {
namespace network {

static int CreateNonblockingOrDie() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_FATAL << "socket() failed: " << std::strerror(errno);
    }
    return sockfd;
}

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      accept_socket_(CreateNonblockingOrDie()),
      accept_channel_(loop, accept_socket_.fd()),
      listening_(false),
      idle_fd_(::open("/dev/null", O_RDONLY | O_CLOEXEC)) {

    accept_socket_.SetReuseAddr(true);
    accept_socket_.SetReusePort(reuseport);
    accept_socket_.BindAddress(listenAddr);

    accept_channel_.SetReadCallback(
        [this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Acceptor::~Acceptor() {
    accept_channel_.DisableAll();
    accept_channel_.Remove();
    if (idle_fd_ >= 0) {
        ::close(idle_fd_);
    }
}

void Acceptor::Listen() {
    listening_ = true;
    accept_socket_.Listen();
    accept_channel_.EnableReading();
}

void Acceptor::HandleRead() {
    InetAddress peerAddr;
    int connfd = accept_socket_.Accept(&peerAddr);
    if (connfd >= 0) {
        if (new_connection_callback_) {
            new_connection_callback_(connfd, peerAddr);
        } else {
            ::close(connfd);
        }
        return;
    }

    int saved_errno = errno;
    if (saved_errno == EAGAIN || saved_errno == EINTR) {
        return;
    }
    LOG_ERROR << "Acceptor::HandleRead: " << std::strerror(saved_errno);
    if (saved_errno == EMFILE && idle_fd_ >= 0) {
        LOG_ERROR << "sockfd reached limit, shedding one connection";
        ::close(idle_fd_);
        idle_fd_ = ::accept(accept_socket_.fd(), nullptr, nullptr);
        if (idle_fd_ >= 0) {
            ::close(idle_fd_);
        }
        idle_fd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    }
}

} // namespace network
} // namespace linkgate
