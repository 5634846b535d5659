#include "linkgate/protocol/HttpContext.h"
#include "linkgate/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace linkgate {
namespace protocol {

static std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

static const char kCRLF[] = "\r\n";

void HttpContext::reset() {
    state_ = kExpectRequestLine;
    HttpRequest dummy;
    request_.swap(dummy);
    headerCount_ = 0;
    chunked_ = false;
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;
}

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    bool succeed = false;
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space != end && request_.setMethod(start, space)) {
        start = space + 1;
        space = std::find(start, end, ' ');
        if (space != end) {
            const char* question = std::find(start, space, '?');
            if (question != space) {
                request_.setPath(start, question);
                request_.setQuery(question + 1, space);
            } else {
                request_.setPath(start, space);
            }
            start = space + 1;
            succeed = end - start == 8 && std::equal(start, end - 1, "HTTP/1.");
            if (succeed) {
                if (*(end - 1) == '1') {
                    request_.setVersion(HttpRequest::kHttp11);
                } else if (*(end - 1) == '0') {
                    request_.setVersion(HttpRequest::kHttp10);
                } else {
                    succeed = false;
                }
            }
        }
    }
    return succeed && !request_.path().empty();
}

// return false if any error
bool HttpContext::parseRequest(linkgate::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    bool ok = true;
    bool hasMore = true;
    while (hasMore && ok) {
        if (state_ == kExpectRequestLine) {
            const char* crlf = std::search(buf->Peek(), static_cast<const char*>(buf->BeginWrite()), kCRLF, kCRLF + 2);
            if (crlf < buf->BeginWrite()) {
                ok = processRequestLine(buf->Peek(), crlf);
                if (ok) {
                    receiveTime_ = receiveTime;
                    buf->Retrieve(crlf + 2 - buf->Peek());
                    state_ = kExpectHeaders;
                }
            } else {
                ok = buf->ReadableBytes() <= kMaxLineLength;
                hasMore = false;
            }
        } else if (state_ == kExpectHeaders) {
            const char* crlf = std::search(buf->Peek(), static_cast<const char*>(buf->BeginWrite()), kCRLF, kCRLF + 2);
            if (crlf >= buf->BeginWrite()) {
                ok = buf->ReadableBytes() <= kMaxLineLength;
                hasMore = false;
                continue;
            }
            const char* colon = std::find(buf->Peek(), crlf, ':');
            if (colon != crlf) {
                if (++headerCount_ > kMaxHeaders) {
                    ok = false;
                    continue;
                }
                request_.addHeader(buf->Peek(), colon, crlf);
                buf->Retrieve(crlf + 2 - buf->Peek());
                continue;
            }
            if (crlf != buf->Peek()) {
                // Header line without a colon.
                ok = false;
                continue;
            }
            buf->Retrieve(2);

            const std::string te = request_.getHeader("Transfer-Encoding");
            if (!te.empty() && ToLowerCopy(te).find("chunked") != std::string::npos) {
                chunked_ = true;
            } else {
                const std::string cl = request_.getHeader("Content-Length");
                if (!cl.empty()) {
                    char* endp = nullptr;
                    long long v = std::strtoll(cl.c_str(), &endp, 10);
                    if (endp == cl.c_str() || *endp != '\0' || v < 0) {
                        ok = false;
                        continue;
                    }
                    bodyRemaining_ = static_cast<size_t>(v);
                }
            }
            state_ = (chunked_ || bodyRemaining_ > 0) ? kExpectBody : kGotAll;
            hasMore = state_ != kGotAll;
        } else if (state_ == kExpectBody) {
            ok = processBody(buf);
            hasMore = false;
        } else {
            hasMore = false;
        }
    }
    return ok;
}

bool HttpContext::processBody(linkgate::network::Buffer* buf) {
    if (!chunked_) {
        const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
        if (n > 0) {
            request_.appendBody(buf->Peek(), n);
            buf->Retrieve(n);
            bodyRemaining_ -= n;
        }
        if (bodyRemaining_ == 0) {
            state_ = kGotAll;
        }
        return true;
    }

    while (true) {
        if (expectingChunkSize_) {
            const char* crlf = std::search(buf->Peek(), static_cast<const char*>(buf->BeginWrite()), kCRLF, kCRLF + 2);
            if (crlf >= buf->BeginWrite()) {
                return buf->ReadableBytes() <= kMaxLineLength;
            }
            std::string line(buf->Peek(), crlf);
            buf->Retrieve(crlf + 2 - buf->Peek());

            // Strip chunk extensions.
            auto semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            char* endp = nullptr;
            long long sz = std::strtoll(line.c_str(), &endp, 16);
            if (endp == line.c_str() || sz < 0) {
                return false;
            }
            chunkSize_ = static_cast<size_t>(sz);
            expectingChunkSize_ = false;
            continue;
        }

        if (chunkSize_ == 0) {
            // Last chunk seen: skip trailers up to the blank line.
            const char* tcrlf = std::search(buf->Peek(), static_cast<const char*>(buf->BeginWrite()), kCRLF, kCRLF + 2);
            if (tcrlf >= buf->BeginWrite()) return true;
            const bool blank = tcrlf == buf->Peek();
            buf->Retrieve(tcrlf + 2 - buf->Peek());
            if (blank) {
                state_ = kGotAll;
                return true;
            }
            continue;
        }

        if (buf->ReadableBytes() < chunkSize_ + 2) {
            return true;
        }
        request_.appendBody(buf->Peek(), chunkSize_);
        buf->Retrieve(chunkSize_);
        const char* p = buf->Peek();
        if (p[0] != '\r' || p[1] != '\n') {
            return false;
        }
        buf->Retrieve(2);
        expectingChunkSize_ = true;
    }
}

} // namespace protocol
} // namespace linkgate
