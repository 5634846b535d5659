#include "linkgate/protocol/HttpResponse.h"

#include <cctype>
#include <cstdio>
#include <cstring>

namespace linkgate {
namespace protocol {

namespace {

bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

const char* HttpResponse::ReasonPhrase(HttpStatusCode code) {
    switch (code) {
        case k200Ok: return "OK";
        case k206PartialContent: return "Partial Content";
        case k301MovedPermanently: return "Moved Permanently";
        case k302Found: return "Found";
        case k400BadRequest: return "Bad Request";
        case k404NotFound: return "Not Found";
        case k405MethodNotAllowed: return "Method Not Allowed";
        case k500InternalServerError: return "Internal Server Error";
        default: return "Unknown";
    }
}

void HttpResponse::setStatusCode(HttpStatusCode code) {
    statusCode_ = code;
    statusMessage_ = ReasonPhrase(code);
}

void HttpResponse::addHeader(const std::string& key, const std::string& value) {
    for (auto& header : headers_) {
        if (IEquals(header.first, key)) {
            header.second = value;
            return;
        }
    }
    headers_.emplace_back(key, value);
}

std::string HttpResponse::getHeader(const std::string& key) const {
    for (const auto& header : headers_) {
        if (IEquals(header.first, key)) {
            return header.second;
        }
    }
    return std::string();
}

void HttpResponse::appendHeadToBuffer(linkgate::network::Buffer* output, uint64_t contentLength) const {
    char buf[64];
    std::snprintf(buf, sizeof buf, "HTTP/1.1 %d ", static_cast<int>(statusCode_));
    output->Append(buf, std::strlen(buf));
    output->Append(statusMessage_);
    output->Append("\r\n");

    std::snprintf(buf, sizeof buf, "Content-Length: %llu\r\n",
                  static_cast<unsigned long long>(contentLength));
    output->Append(buf, std::strlen(buf));
    if (closeConnection_) {
        output->Append("Connection: close\r\n");
    } else {
        output->Append("Connection: keep-alive\r\n");
    }

    for (const auto& header : headers_) {
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }

    output->Append("\r\n");
}

void HttpResponse::appendToBuffer(linkgate::network::Buffer* output) const {
    appendHeadToBuffer(output, body_.size());
    output->Append(body_);
}

} // namespace protocol
} // namespace linkgate
