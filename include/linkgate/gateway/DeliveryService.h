#pragma once

#include "linkgate/common/noncopyable.h"
#include "linkgate/gateway/GatewayOptions.h"
#include "linkgate/protocol/ResponseWriter.h"

#include <string>

namespace linkgate {
namespace protocol {
class HttpRequest;
}
namespace balancer {
class SessionRegistry;
}

namespace gateway {

// Serves file links: decode, bind a session, fetch and verify metadata,
// negotiate the range, then stream the window (or redirect to the backend
// URL). The session's workload unit is held by the streaming task and
// released exactly once whichever way the task ends.
class DeliveryService : linkgate::common::noncopyable {
public:
    DeliveryService(linkgate::balancer::SessionRegistry& registry,
                    const GatewayOptions& options);

    // Returns at once; the response completes through writer.
    void HandleDelivery(const linkgate::protocol::HttpRequest& req,
                        const std::string& tokenPath,
                        const linkgate::protocol::ResponseWriterPtr& writer);

    const GatewayOptions& options() const { return options_; }

private:
    linkgate::balancer::SessionRegistry& registry_;
    GatewayOptions options_;
};

} // namespace gateway
} // namespace linkgate
