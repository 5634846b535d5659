#pragma once

#include "linkgate/common/noncopyable.h"
#include "linkgate/network/InetAddress.h"
#include "linkgate/network/Callbacks.h"
#include "linkgate/network/TcpConnection.h"
#include "linkgate/network/TlsContext.h"

#include <map>
#include <string>
#include <atomic>
#include <memory>

namespace linkgate {
namespace network {

class EventLoop;
class Acceptor;

// Single-loop TCP listener. All connections share the acceptor's loop.
class TcpServer : linkgate::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }
    InetAddress ListenAddress() const;
    // TLS termination (optional). The listener sniffs the first byte and
    // serves both HTTPS and plain HTTP on the same port.
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath);

    // 0 means unlimited
    void SetMaxConnections(int maxConnections);
    // Idle connection cleanup (0 disables). cleanupIntervalSec defaults to 1s if <=0.
    void SetIdleTimeout(double idleTimeoutSec, double cleanupIntervalSec = 1.0);

    void Start();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);
    void ScheduleCleanup();
    void CleanupIdleConnections();

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::shared_ptr<TlsContext> tlsCtx_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    std::atomic_int started_;
    int next_conn_id_;
    ConnectionMap connections_;

    int maxConnections_{0};
    double idleTimeoutSec_{0.0};
    double cleanupIntervalSec_{1.0};
    TimerId cleanupTimer_{0};
};

} // namespace network
} // namespace linkgate
