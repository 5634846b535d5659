#include "linkgate/gateway/GatewayServer.h"
#include "linkgate/gateway/GatewayError.h"
#include "linkgate/gateway/LinkCodec.h"
#include "linkgate/balancer/SessionRegistry.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/network/InetAddress.h"
#include "linkgate/protocol/Compression.h"
#include "linkgate/protocol/HttpRequest.h"
#include "linkgate/protocol/HttpResponse.h"
#include "linkgate/protocol/UrlCodec.h"
#include "linkgate/common/Logger.h"
#include "linkgate/common/TimeFormat.h"

#include <sstream>

namespace linkgate {
namespace gateway {

using linkgate::protocol::Compression;
using linkgate::protocol::HttpRequest;
using linkgate::protocol::HttpResponse;
using linkgate::protocol::ResponseWriterPtr;

namespace {

const char kWatchPrefix[] = "/watch/";

std::string JsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out.push_back(hex[(c >> 4) & 0xF]);
                    out.push_back(hex[c & 0xF]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

bool StartsWith(const std::string& s, const char* prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

} // namespace

GatewayServer::GatewayServer(linkgate::network::EventLoop* loop,
                             const linkgate::network::InetAddress& listenAddr,
                             linkgate::balancer::SessionRegistry& registry,
                             const GatewayOptions& options,
                             PreviewRendererPtr renderer)
    : server_(loop, listenAddr, "linkgate"),
      registry_(registry),
      options_(options),
      renderer_(std::move(renderer)),
      delivery_(registry, options),
      startTime_(std::chrono::steady_clock::now()) {
    if (!renderer_) {
        renderer_.reset(new TemplatePreviewRenderer(options_.previewTemplatePath));
    }
    server_.setHttpCallback([this](const HttpRequest& req, const ResponseWriterPtr& writer) {
        HandleRequest(req, writer);
    });
}

bool GatewayServer::EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
    return server_.tcpServer().EnableTls(certPemPath, keyPemPath);
}

void GatewayServer::SetMaxConnections(int maxConnections) {
    server_.tcpServer().SetMaxConnections(maxConnections);
}

void GatewayServer::SetIdleTimeout(double idleTimeoutSec, double cleanupIntervalSec) {
    server_.tcpServer().SetIdleTimeout(idleTimeoutSec, cleanupIntervalSec);
}

void GatewayServer::Start() {
    LOG_INFO << "linkgate " << options_.version << " serving on " << server_.tcpServer().hostport()
             << " (" << DeliveryModeName(options_.mode) << " mode, "
             << registry_.SessionCount() << " sessions)";
    server_.start();
}

linkgate::network::InetAddress GatewayServer::ListenAddress() const {
    return server_.tcpServer().ListenAddress();
}

void GatewayServer::HandleRequest(const HttpRequest& req, const ResponseWriterPtr& writer) {
    const std::string& path = req.path();
    const HttpRequest::Method method = req.getMethod();
    const bool getOrHead = method == HttpRequest::kGet || method == HttpRequest::kHead;

    if (getOrHead && path == "/") {
        HttpResponse response(false);
        response.setStatusCode(HttpResponse::k302Found);
        response.addHeader("Location", options_.projectUrl);
        ApplyCorsHeaders(&response);
        Respond(req, response, writer);
        return;
    }

    if (getOrHead && path == "/status") {
        HttpResponse response(false);
        response.setStatusCode(HttpResponse::k200Ok);
        response.setContentType("application/json");
        response.setBody(StatusJson());
        ReplyText(req, response, writer);
        return;
    }

    if (method == HttpRequest::kOptions) {
        HttpResponse response(false);
        response.setStatusCode(HttpResponse::k200Ok);
        ApplyCorsHeaders(&response);
        response.addHeader("Access-Control-Max-Age", "86400");
        writer->Reply(response);
        return;
    }

    if (getOrHead && StartsWith(path, kWatchPrefix)) {
        HandlePreview(req, path.substr(sizeof(kWatchPrefix) - 1), writer);
        return;
    }

    if (method == HttpRequest::kGet) {
        delivery_.HandleDelivery(req, path, writer);
        return;
    }

    // Anything else, HEAD on a media link included.
    LOG_DEBUG << "Rejecting " << req.methodString() << " " << path;
    HttpResponse response(false);
    response.setStatusCode(HttpResponse::k405MethodNotAllowed);
    response.addHeader("Allow", "GET, OPTIONS");
    ApplyCorsHeaders(&response);
    writer->Reply(response);
}

void GatewayServer::HandlePreview(const HttpRequest& req,
                                  const std::string& tokenPath,
                                  const ResponseWriterPtr& writer) {
    linkgate::common::Result<LinkRef> link =
        DecodeLink(tokenPath, linkgate::protocol::UrlCodec::ParseQuery(req.query()));
    if (!link.ok()) {
        LOG_WARN << "Preview " << req.path() << " rejected: " << link.error().detail;
        Respond(req, MakeErrorResponse(link.error(), options_.mode), writer);
        return;
    }

    HttpResponse response(false);
    response.setStatusCode(HttpResponse::k200Ok);
    response.setContentType("text/html; charset=utf-8");
    response.setBody(renderer_->Render(link.value().objectId, link.value().secretHash, "stream"));
    ReplyText(req, response, writer);
}

void GatewayServer::ReplyText(const HttpRequest& req, HttpResponse& response, const ResponseWriterPtr& writer) {
    ApplyCorsHeaders(&response);
    response.addHeader("Vary", "Accept-Encoding");
    const Compression::Encoding enc = req.hasHeader("Accept-Encoding")
        ? Compression::NegotiateAcceptEncoding(req.getHeader("Accept-Encoding"))
        : Compression::Encoding::kIdentity;
    if (enc != Compression::Encoding::kIdentity) {
        std::string compressed;
        if (Compression::Compress(enc, response.body(), &compressed)) {
            response.setBody(compressed);
            response.addHeader("Content-Encoding", Compression::EncodingName(enc));
        } else {
            LOG_WARN << Compression::EncodingName(enc) << " failed for " << req.path() << ", sending identity";
        }
    }
    Respond(req, response, writer);
}

void GatewayServer::Respond(const HttpRequest& req, const HttpResponse& response, const ResponseWriterPtr& writer) {
    if (req.getMethod() != HttpRequest::kHead) {
        writer->Reply(response);
        return;
    }
    writer->BeginStream(response, static_cast<uint64_t>(response.body().size()));
    writer->EndStream();
}

std::string GatewayServer::StatusJson() const {
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - startTime_).count();

    std::ostringstream json;
    json << "{"
         << "\"server\":{"
         << "\"status\":\"operational\","
         << "\"version\":\"" << JsonEscape(options_.version) << "\","
         << "\"uptime\":\"" << JsonEscape(linkgate::common::ReadableDuration(uptime)) << "\""
         << "},"
         << "\"bot\":{"
         << "\"username\":\"@" << JsonEscape(options_.botUsername) << "\","
         << "\"active_clients\":" << registry_.SessionCount()
         << "}"
         << "}";
    return json.str();
}

} // namespace gateway
} // namespace linkgate
