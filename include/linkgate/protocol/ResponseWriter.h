#pragma once

#include "linkgate/protocol/HttpResponse.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace linkgate {
namespace protocol {

// Asynchronous reply channel for one request. A handler either calls Reply()
// once, or BeginStream() followed by WriteChunk()... and EndStream() or
// AbortStream(). Calls after the response finished are ignored.
class ResponseWriter {
public:
    using DrainCallback = std::function<void()>;
    using AbortCallback = std::function<void()>;

    virtual ~ResponseWriter() = default;

    virtual void Reply(const HttpResponse& response) = 0;

    // Sends status line and headers; the body follows as chunks totalling contentLength.
    virtual void BeginStream(const HttpResponse& head, uint64_t contentLength) = 0;
    // onDrained runs on the loop once the chunk has left the output buffer.
    virtual void WriteChunk(const std::string& data, DrainCallback onDrained) = 0;
    virtual void EndStream() = 0;
    // Server-side failure after the head was sent: the connection is dropped.
    virtual void AbortStream() = 0;

    // Runs at most once, when the peer goes away before the response finished.
    virtual void SetAbortCallback(AbortCallback cb) = 0;
    virtual bool IsAborted() const = 0;
    virtual bool IsFinished() const = 0;
};

using ResponseWriterPtr = std::shared_ptr<ResponseWriter>;

} // namespace protocol
} // namespace linkgate
