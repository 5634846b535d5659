#pragma once

#include "linkgate/network/TcpServer.h"
#include "linkgate/common/noncopyable.h"
#include "linkgate/protocol/ResponseWriter.h"

#include <functional>
#include <string>

namespace linkgate {
namespace protocol {

class HttpRequest;

// HTTP/1.1 server with asynchronous responses. Requests on one connection
// are answered in order; a pipelined request waits until the previous
// response finished.
class HttpServer : linkgate::common::noncopyable {
public:
    using HttpCallback = std::function<void(const HttpRequest&, const ResponseWriterPtr&)>;

    HttpServer(linkgate::network::EventLoop* loop,
               const linkgate::network::InetAddress& listenAddr,
               const std::string& name,
               linkgate::network::TcpServer::Option option = linkgate::network::TcpServer::kNoReusePort);

    linkgate::network::EventLoop* getLoop() const { return server_.getLoop(); }
    linkgate::network::TcpServer& tcpServer() { return server_; }
    const linkgate::network::TcpServer& tcpServer() const { return server_; }

    void setHttpCallback(const HttpCallback& cb) {
        httpCallback_ = cb;
    }

    void start();

private:
    void onConnection(const linkgate::network::TcpConnectionPtr& conn);
    void onMessage(const linkgate::network::TcpConnectionPtr& conn,
                   linkgate::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void onWriteComplete(const linkgate::network::TcpConnectionPtr& conn);
    void processBuffered(const linkgate::network::TcpConnectionPtr& conn);
    void onRequest(const linkgate::network::TcpConnectionPtr& conn,
                   const HttpRequest& req,
                   const ResponseWriterPtr& writer);

    linkgate::network::TcpServer server_;
    HttpCallback httpCallback_;
};

} // namespace protocol
} // namespace linkgate
