#pragma once

#include "linkgate/protocol/HttpRequest.h"
#include "linkgate/network/Buffer.h"

#include <chrono>

namespace linkgate {
namespace protocol {

// Incremental HTTP/1.x request parser. One instance per connection.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    // Bounds on the request head; larger heads are rejected.
    static constexpr size_t kMaxLineLength = 8 * 1024;
    static constexpr size_t kMaxHeaders = 100;

    HttpContext()
        : state_(kExpectRequestLine) {}

    // return false if some error
    bool parseRequest(linkgate::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    void reset();

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }
    std::chrono::system_clock::time_point receiveTime() const { return receiveTime_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    bool processBody(linkgate::network::Buffer* buf);

    HttpRequestParseState state_;
    HttpRequest request_;
    std::chrono::system_clock::time_point receiveTime_;
    size_t headerCount_{0};

    // Body parsing state
    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};
};

} // namespace protocol
} // namespace linkgate
