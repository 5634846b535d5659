#pragma once

#include <string>
#include <vector>
#include <utility>
#include <cstdint>

#include "linkgate/network/Buffer.h"

namespace linkgate {
namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k206PartialContent = 206,
        k301MovedPermanently = 301,
        k302Found = 302,
        k400BadRequest = 400,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k500InternalServerError = 500,
    };

    explicit HttpResponse(bool close)
        : statusCode_(kUnknown), closeConnection_(close) {}

    // Also sets the standard reason phrase.
    void setStatusCode(HttpStatusCode code);
    HttpStatusCode statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { addHeader("Content-Type", contentType); }

    // Replaces an existing header of the same name (case-insensitive).
    void addHeader(const std::string& key, const std::string& value);
    std::string getHeader(const std::string& key) const;
    const std::vector<std::pair<std::string, std::string>>& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    static const char* ReasonPhrase(HttpStatusCode code);

    // Status line, headers and body; Content-Length taken from the body.
    void appendToBuffer(linkgate::network::Buffer* output) const;
    // Status line and headers only, for a body streamed separately.
    void appendHeadToBuffer(linkgate::network::Buffer* output, uint64_t contentLength) const;

private:
    HttpStatusCode statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string body_;
};

} // namespace protocol
} // namespace linkgate
