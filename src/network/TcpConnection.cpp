#include "linkgate/network/TcpConnection.h"
#include "linkgate/network/Socket.h"
#include "linkgate/network/Channel.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <sys/socket.h>

namespace linkgate {
namespace network {

static std::int64_t ToSteadyNs(std::chrono::steady_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

static std::chrono::steady_clock::time_point FromSteadyNs(std::int64_t ns) {
    return std::chrono::steady_clock::time_point(std::chrono::nanoseconds(ns));
}

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr,
                             ssl_ctx_st* tlsCtx)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      tlsCtx_(tlsCtx) {

    channel_->SetReadCallback(
        [this](std::chrono::system_clock::time_point t) { HandleRead(t); });
    channel_->SetWriteCallback([this]() { HandleWrite(); });
    channel_->SetCloseCallback([this]() { HandleClose(); });
    channel_->SetErrorCallback([this]() { HandleError(); });

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] at " << this << " fd=" << sockfd;
    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
    lastActiveNs_.store(ToSteadyNs(std::chrono::steady_clock::now()), std::memory_order_relaxed);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] at " << this << " fd=" << channel_->fd() << " state=" << state_;
    if (ssl_) {
        SSL_free(reinterpret_cast<SSL*>(ssl_));
        ssl_ = nullptr;
    }
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    Touch();
    channel_->Tie(shared_from_this());
    channel_->EnableReading();

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

bool TcpConnection::tlsTryInitFromPeek() {
    if (!tlsEnabled()) return false;
    if (tlsState_ != 0) return false;

    unsigned char b = 0;
    const ssize_t n = ::recv(channel_->fd(), &b, 1, MSG_PEEK);
    if (n <= 0) return false;

    // TLS record type 0x16 indicates Handshake. If not, treat as plaintext.
    if (b != 0x16) {
        tlsCtx_ = nullptr;
        return false;
    }

    SSL* s = SSL_new(reinterpret_cast<SSL_CTX*>(tlsCtx_));
    if (!s) {
        tlsCtx_ = nullptr;
        return false;
    }
    SSL_set_fd(s, channel_->fd());
    SSL_set_accept_state(s);
    ssl_ = reinterpret_cast<ssl_st*>(s);
    tlsState_ = 1;
    tlsWantWrite_ = false;
    return true;
}

bool TcpConnection::tlsDoHandshake() {
    if (!ssl_ || tlsState_ != 1) return false;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_accept(s);
    if (r == 1) {
        tlsState_ = 2;
        tlsWantWrite_ = false;
        if (outputBuffer_.ReadableBytes() > 0 && !channel_->IsWriting()) {
            channel_->EnableWriting();
        }
        return true;
    }
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) {
        tlsWantWrite_ = false;
        return false;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        tlsWantWrite_ = true;
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return false;
    }
    unsigned long le = ERR_get_error();
    if (le != 0) {
        char buf[256];
        ERR_error_string_n(le, buf, sizeof(buf));
        LOG_WARN << "TLS handshake failed [" << name_ << "]: " << buf;
    } else {
        LOG_WARN << "TLS handshake failed [" << name_ << "] error=" << e;
    }
    HandleClose();
    return false;
}

ssize_t TcpConnection::tlsReadOnce(char* buf, size_t cap, int* savedErrno) {
    if (!ssl_ || cap == 0) return 0;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_read(s, buf, static_cast<int>(cap));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_READ) return -2;
    if (e == SSL_ERROR_WANT_WRITE) {
        tlsWantWrite_ = true;
        if (!channel_->IsWriting()) channel_->EnableWriting();
        return -2;
    }
    if (e == SSL_ERROR_ZERO_RETURN) return 0;
    if (savedErrno) *savedErrno = EIO;
    return -1;
}

ssize_t TcpConnection::tlsWriteOnce(const void* data, size_t len, int* savedErrno) {
    if (!ssl_ || len == 0) return 0;
    SSL* s = reinterpret_cast<SSL*>(ssl_);
    const int r = SSL_write(s, data, static_cast<int>(len));
    if (r > 0) return r;
    const int e = SSL_get_error(s, r);
    if (e == SSL_ERROR_WANT_WRITE) return -2;
    if (e == SSL_ERROR_WANT_READ) return -2;
    if (savedErrno) *savedErrno = EIO;
    return -1;
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (tlsEnabled() && tlsState_ == 0) {
        tlsTryInitFromPeek();
    }
    if (ssl_ && tlsState_ == 1) {
        tlsDoHandshake();
        if (tlsState_ != 2) return;
    }

    int savedErrno = 0;
    ssize_t n = 0;
    if (ssl_ && tlsState_ == 2) {
        char tmp[64 * 1024];
        n = tlsReadOnce(tmp, sizeof(tmp), &savedErrno);
        if (n > 0) {
            inputBuffer_.Append(tmp, static_cast<size_t>(n));
        } else if (n == -2) {
            return;
        }
    } else {
        n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    }
    if (n > 0) {
        Touch();
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandleClose();
    } else if (savedErrno == EAGAIN || savedErrno == EINTR) {
        return;
    } else {
        LOG_ERROR << "TcpConnection::HandleRead [" << name_ << "]: " << std::strerror(savedErrno);
        HandleError();
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (ssl_ && tlsState_ == 1 && tlsWantWrite_) {
        tlsDoHandshake();
        if (tlsState_ != 2) return;
    }

    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }
    if (outputBuffer_.ReadableBytes() == 0) {
        channel_->DisableWriting();
        return;
    }

    ssize_t n = 0;
    int savedErrno = 0;
    if (ssl_ && tlsState_ == 2) {
        n = tlsWriteOnce(outputBuffer_.Peek(), outputBuffer_.ReadableBytes(), &savedErrno);
        if (n == -2) return;
    } else {
        n = ::write(channel_->fd(), outputBuffer_.Peek(), outputBuffer_.ReadableBytes());
        if (n < 0) savedErrno = errno;
    }
    if (n > 0) {
        Touch();
        outputBuffer_.Retrieve(static_cast<size_t>(n));
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            if (writeCompleteCallback_) {
                auto self = shared_from_this();
                auto cb = writeCompleteCallback_;
                loop_->QueueInLoop([cb, self]() { cb(self); });
            }
            if (state_ == kDisconnecting) {
                ShutdownInLoop();
            }
        }
    } else if (savedErrno != EAGAIN && savedErrno != EINTR) {
        LOG_ERROR << "TcpConnection::HandleWrite [" << name_ << "]: " << std::strerror(savedErrno);
        if (savedErrno == EPIPE || savedErrno == ECONNRESET || savedErrno == EIO) {
            HandleClose();
        }
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) {
        return;
    }
    LOG_DEBUG << "fd = " << channel_->fd() << " state = " << state_;
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }

    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    int err = 0;
    int optval;
    socklen_t optlen = static_cast<socklen_t>(sizeof optval);
    if (::getsockopt(channel_->fd(), SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        err = errno;
    } else {
        err = optval;
    }
    LOG_ERROR << "TcpConnection::HandleError name:" << name_ << " - SO_ERROR:" << err;
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ == kConnected) {
        if (loop_->IsInLoopThread()) {
            SendInLoop(data, len);
        } else {
            std::string msg(static_cast<const char*>(data), len);
            loop_->RunInLoop([ptr = shared_from_this(), msg = std::move(msg)]() {
                ptr->SendInLoop(msg.data(), msg.size());
            });
        }
    }
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    ssize_t nwrote = 0;
    size_t remaining = len;
    bool faultError = false;

    if (state_ == kDisconnected) {
        LOG_WARN << "disconnected, give up writing";
        return;
    }

    if (tlsEnabled() && tlsState_ == 0) {
        tlsTryInitFromPeek();
    }

    // A pending handshake holds all application data in the output buffer.
    const bool canWriteDirect = !ssl_ || tlsState_ == 2;
    if (canWriteDirect && !channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        int savedErrno = 0;
        if (ssl_) {
            const ssize_t r = tlsWriteOnce(data, len, &savedErrno);
            nwrote = (r == -2) ? 0 : r;
        } else {
            nwrote = ::write(channel_->fd(), data, len);
            if (nwrote < 0) savedErrno = errno;
        }
        if (nwrote >= 0) {
            Touch();
            remaining = len - static_cast<size_t>(nwrote);
            if (remaining == 0 && writeCompleteCallback_) {
                auto self = shared_from_this();
                auto cb = writeCompleteCallback_;
                loop_->QueueInLoop([cb, self]() { cb(self); });
            }
        } else {
            nwrote = 0;
            if (savedErrno != EWOULDBLOCK) {
                LOG_ERROR << "TcpConnection::SendInLoop [" << name_ << "]: " << std::strerror(savedErrno);
                if (savedErrno == EPIPE || savedErrno == ECONNRESET || savedErrno == EIO) {
                    faultError = true;
                }
            }
        }
    }

    if (!faultError && remaining > 0) {
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        if (canWriteDirect && !channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
    if (faultError) {
        HandleClose();
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        loop_->RunInLoop([conn = shared_from_this()]() { conn->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (!channel_->IsWriting()) {
        socket_->ShutdownWrite();
    }
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        loop_->QueueInLoop([conn = shared_from_this()]() {
            conn->ForceCloseInLoop();
        });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected || state_ == kDisconnecting || state_ == kConnecting) {
        HandleClose();
    }
}

void TcpConnection::Touch() {
    lastActiveNs_.store(ToSteadyNs(std::chrono::steady_clock::now()), std::memory_order_relaxed);
}

std::chrono::steady_clock::time_point TcpConnection::LastActiveTime() const {
    return FromSteadyNs(lastActiveNs_.load(std::memory_order_relaxed));
}

} // namespace network
} // namespace linkgate
