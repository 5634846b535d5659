#pragma once

#include <string>
#include <map>
#include <cstddef>
#include <cctype>

namespace linkgate {
namespace protocol {

// Case-insensitive ordering for header names.
struct HeaderLess {
    bool operator()(const std::string& a, const std::string& b) const {
        const size_t n = a.size() < b.size() ? a.size() : b.size();
        for (size_t i = 0; i < n; ++i) {
            int ca = std::tolower(static_cast<unsigned char>(a[i]));
            int cb = std::tolower(static_cast<unsigned char>(b[i]));
            if (ca != cb) return ca < cb;
        }
        return a.size() < b.size();
    }
};

using HeaderMap = std::map<std::string, std::string, HeaderLess>;

class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kOptions, kOther
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    // Accepts any RFC 7230 token so unknown methods can be answered with 405.
    bool setMethod(const char* start, const char* end);

    Method getMethod() const { return method_; }
    const std::string& methodString() const { return methodName_; }

    void setPath(const char* start, const char* end) {
        path_.assign(start, end);
    }
    const std::string& path() const { return path_; }

    // Raw query string without the leading '?'.
    void setQuery(const char* start, const char* end) {
        query_.assign(start, end);
    }
    const std::string& query() const { return query_; }

    void addHeader(const char* start, const char* colon, const char* end);

    std::string getHeader(const std::string& field) const {
        auto it = headers_.find(field);
        return it != headers_.end() ? it->second : std::string();
    }
    bool hasHeader(const std::string& field) const {
        return headers_.find(field) != headers_.end();
    }

    void setHeader(const std::string& field, const std::string& value) {
        headers_[field] = value;
    }

    const HeaderMap& headers() const { return headers_; }

    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    bool keepAlive() const;

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        methodName_.swap(that.methodName_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
    }

private:
    Method method_;
    Version version_;
    std::string methodName_;
    std::string path_;
    std::string query_;
    HeaderMap headers_;
    std::string body_;
};

} // namespace protocol
} // namespace linkgate
