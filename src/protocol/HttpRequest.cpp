#include "linkgate/protocol/HttpRequest.h"

#include <cstring>

namespace linkgate {
namespace protocol {

namespace {

bool IsTokenChar(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    return c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

bool EqualsNoCase(const std::string& a, const char* b) {
    const size_t n = std::strlen(b);
    if (a.size() != n) return false;
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

bool HttpRequest::setMethod(const char* start, const char* end) {
    methodName_.assign(start, end);
    if (methodName_.empty()) {
        method_ = kInvalid;
        return false;
    }
    for (char c : methodName_) {
        if (!IsTokenChar(c)) {
            method_ = kInvalid;
            return false;
        }
    }
    if (methodName_ == "GET") method_ = kGet;
    else if (methodName_ == "POST") method_ = kPost;
    else if (methodName_ == "HEAD") method_ = kHead;
    else if (methodName_ == "PUT") method_ = kPut;
    else if (methodName_ == "DELETE") method_ = kDelete;
    else if (methodName_ == "OPTIONS") method_ = kOptions;
    else method_ = kOther;
    return true;
}

void HttpRequest::addHeader(const char* start, const char* colon, const char* end) {
    std::string field(start, colon);
    ++colon;
    while (colon < end && std::isspace(static_cast<unsigned char>(*colon))) {
        ++colon;
    }
    std::string value(colon, end);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    headers_[field] = value;
}

bool HttpRequest::keepAlive() const {
    const std::string connection = getHeader("Connection");
    if (EqualsNoCase(connection, "close")) {
        return false;
    }
    if (version_ == kHttp10) {
        return EqualsNoCase(connection, "keep-alive");
    }
    return true;
}

} // namespace protocol
} // namespace linkgate
