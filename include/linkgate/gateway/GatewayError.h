#pragma once

#include "linkgate/common/Result.h"
#include "linkgate/gateway/GatewayOptions.h"
#include "linkgate/protocol/HttpResponse.h"

namespace linkgate {
namespace gateway {

// What the client sees for a failure. Never carries the error detail.
struct PublicError {
    linkgate::protocol::HttpResponse::HttpStatusCode status;
    const char* body;
};

PublicError MapError(linkgate::common::ErrorKind kind, DeliveryMode mode);

// Plain-text error response with the CORS header set.
linkgate::protocol::HttpResponse MakeErrorResponse(const linkgate::common::Error& error, DeliveryMode mode);

// Headers every response carries.
void ApplyCorsHeaders(linkgate::protocol::HttpResponse* response);

} // namespace gateway
} // namespace linkgate
