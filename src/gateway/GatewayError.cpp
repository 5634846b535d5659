#include "linkgate/gateway/GatewayError.h"

namespace linkgate {
namespace gateway {

using linkgate::common::ErrorKind;
using linkgate::protocol::HttpResponse;

namespace {

const char kLinkInvalid[] = "Link expired or invalid";
const char kBadRequest[] = "Bad Request";
const char kNoClients[] = "No clients available";
const char kInternal[] = "Internal server error";

} // namespace

PublicError MapError(ErrorKind kind, DeliveryMode mode) {
    const bool redirect = mode == DeliveryMode::kRedirect;
    switch (kind) {
        case ErrorKind::kInvalidLink:
        case ErrorKind::kUnauthorized:
        case ErrorKind::kObjectNotFound:
            return {HttpResponse::k404NotFound, kLinkInvalid};
        case ErrorKind::kMalformedRange:
            return {HttpResponse::k400BadRequest, kBadRequest};
        case ErrorKind::kNoSessionsAvailable:
            return {HttpResponse::k500InternalServerError, redirect ? kInternal : kNoClients};
        case ErrorKind::kBackendUnreachable:
        case ErrorKind::kBackendTimeout:
        case ErrorKind::kBackendError:
            if (redirect) {
                return {HttpResponse::k500InternalServerError, kInternal};
            }
            return {HttpResponse::k404NotFound, kLinkInvalid};
    }
    return {HttpResponse::k500InternalServerError, kInternal};
}

HttpResponse MakeErrorResponse(const linkgate::common::Error& error, DeliveryMode mode) {
    const PublicError pub = MapError(error.kind, mode);
    HttpResponse response(false);
    response.setStatusCode(pub.status);
    response.setContentType("text/plain; charset=utf-8");
    ApplyCorsHeaders(&response);
    response.setBody(pub.body);
    return response;
}

void ApplyCorsHeaders(HttpResponse* response) {
    response->addHeader("Access-Control-Allow-Origin", "*");
    response->addHeader("Access-Control-Allow-Methods", "GET, OPTIONS");
    response->addHeader("Access-Control-Allow-Headers", "Range, Content-Type, *");
    response->addHeader("Access-Control-Expose-Headers", "Content-Length, Content-Range, Content-Disposition");
}

} // namespace gateway
} // namespace linkgate
