#include "linkgate/network/TcpServer.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/network/Acceptor.h"
#include "linkgate/common/Logger.h"

#include <unistd.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <vector>

namespace linkgate {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      started_(0),
      next_conn_id_(1) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peer) { NewConnection(sockfd, peer); });
}

TcpServer::~TcpServer() {
    if (cleanupTimer_ != 0) {
        loop_->CancelTimer(cleanupTimer_);
    }
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->ConnectDestroyed();
    }
}

InetAddress TcpServer::ListenAddress() const {
    return acceptor_->ListenAddress();
}

bool TcpServer::EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
    auto ctx = std::make_shared<TlsContext>();
    if (!ctx->InitServer(certPemPath, keyPemPath)) return false;
    tlsCtx_ = std::move(ctx);
    return true;
}

void TcpServer::SetMaxConnections(int maxConnections) {
    maxConnections_ = maxConnections;
}

void TcpServer::SetIdleTimeout(double idleTimeoutSec, double cleanupIntervalSec) {
    idleTimeoutSec_ = idleTimeoutSec;
    cleanupIntervalSec_ = (cleanupIntervalSec > 0.0) ? cleanupIntervalSec : 1.0;
}

void TcpServer::Start() {
    if (started_++ == 0) {
        loop_->RunInLoop([this]() {
            acceptor_->Listen();
            if (idleTimeoutSec_ > 0.0) {
                ScheduleCleanup();
            }
        });
    }
}

void TcpServer::ScheduleCleanup() {
    cleanupTimer_ = loop_->RunAfter(cleanupIntervalSec_, [this]() {
        cleanupTimer_ = 0;
        CleanupIdleConnections();
        ScheduleCleanup();
    });
}

void TcpServer::CleanupIdleConnections() {
    if (idleTimeoutSec_ <= 0.0) return;

    const auto now = std::chrono::steady_clock::now();
    const auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(idleTimeoutSec_));

    std::vector<TcpConnectionPtr> toClose;
    for (auto const& [name, conn] : connections_) {
        if (!conn) continue;
        // Streaming responses keep the output buffer busy; they are not idle.
        if (conn->OutputBytes() > 0) continue;
        if (now - conn->LastActiveTime() > timeout) {
            LOG_WARN << "TcpServer::CleanupIdleConnections [" << name_ << "] closing idle conn "
                     << name << " peer=" << conn->peerAddress().toIpPort();
            toClose.push_back(conn);
        }
    }

    for (auto& conn : toClose) {
        conn->ForceClose();
    }
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    const int currentTotal = static_cast<int>(connections_.size());
    if (maxConnections_ > 0 && currentTotal >= maxConnections_) {
        LOG_WARN << "TcpServer::NewConnection [" << name_ << "] reject (max total reached): "
                 << peerAddr.toIpPort() << " total=" << currentTotal << " limit=" << maxConnections_;
        ::close(sockfd);
        return;
    }

    char buf[64];
    std::snprintf(buf, sizeof buf, "-%s#%d", hostport_.c_str(), next_conn_id_);
    ++next_conn_id_;
    std::string connName = name_ + buf;

    LOG_DEBUG << "TcpServer::NewConnection [" << name_ << "] - new connection [" << connName
              << "] from " << peerAddr.toIpPort();

    struct sockaddr_in local;
    socklen_t len = sizeof local;
    std::memset(&local, 0, sizeof local);
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&local), &len) < 0) {
        LOG_ERROR << "TcpServer::NewConnection getsockname failed errno=" << errno;
    }
    InetAddress localAddr(local);
    TcpConnectionPtr conn(new TcpConnection(loop_,
                                            connName,
                                            sockfd,
                                            localAddr,
                                            peerAddr,
                                            tlsCtx_ ? tlsCtx_->ctx() : nullptr));
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback(
        [this](const TcpConnectionPtr& c) { RemoveConnection(c); });

    conn->ConnectEstablished();
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    // Defer removal so the connection outlives its own event callback.
    loop_->QueueInLoop([this, conn]() { RemoveConnectionInLoop(conn); });
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer::RemoveConnectionInLoop [" << name_ << "] - connection " << conn->name();
    connections_.erase(conn->name());
    loop_->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace linkgate
