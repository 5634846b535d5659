#pragma once

#include "linkgate/common/noncopyable.h"
#include "linkgate/gateway/DeliveryService.h"
#include "linkgate/gateway/GatewayOptions.h"
#include "linkgate/gateway/PreviewRenderer.h"
#include "linkgate/protocol/HttpServer.h"

#include <chrono>
#include <string>

namespace linkgate {
namespace network {
class EventLoop;
class InetAddress;
}
namespace protocol {
class HttpRequest;
class HttpResponse;
}
namespace balancer {
class SessionRegistry;
}

namespace gateway {

// HTTP front of the gateway: routes requests to delivery, preview,
// status, preflight and root handlers.
class GatewayServer : linkgate::common::noncopyable {
public:
    GatewayServer(linkgate::network::EventLoop* loop,
                  const linkgate::network::InetAddress& listenAddr,
                  linkgate::balancer::SessionRegistry& registry,
                  const GatewayOptions& options,
                  PreviewRendererPtr renderer);

    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath);
    void SetMaxConnections(int maxConnections);
    void SetIdleTimeout(double idleTimeoutSec, double cleanupIntervalSec);

    void Start();

    // Route table entry point; also driven directly by tests.
    void HandleRequest(const linkgate::protocol::HttpRequest& req,
                       const linkgate::protocol::ResponseWriterPtr& writer);

    // Body of GET /status.
    std::string StatusJson() const;

    linkgate::network::InetAddress ListenAddress() const;

private:
    void HandlePreview(const linkgate::protocol::HttpRequest& req,
                       const std::string& tokenPath,
                       const linkgate::protocol::ResponseWriterPtr& writer);
    void ReplyText(const linkgate::protocol::HttpRequest& req,
                   linkgate::protocol::HttpResponse& response,
                   const linkgate::protocol::ResponseWriterPtr& writer);
    // HEAD gets the same status and headers with the body left off.
    void Respond(const linkgate::protocol::HttpRequest& req,
                 const linkgate::protocol::HttpResponse& response,
                 const linkgate::protocol::ResponseWriterPtr& writer);

    linkgate::protocol::HttpServer server_;
    linkgate::balancer::SessionRegistry& registry_;
    GatewayOptions options_;
    PreviewRendererPtr renderer_;
    DeliveryService delivery_;
    const std::chrono::steady_clock::time_point startTime_;
};

} // namespace gateway
} // namespace linkgate
