#pragma once

#include "linkgate/backend/BackendClient.h"
#include "linkgate/common/noncopyable.h"
#include "linkgate/common/Result.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace linkgate {
namespace network {
class EventLoop;
}

namespace backend {

// Pull-based reader for one byte window of an object. Produces exactly the
// requested number of bytes, one chunk per Next().
class ChunkStream : linkgate::common::noncopyable,
                    public std::enable_shared_from_this<ChunkStream> {
public:
    using ChunkCallback = std::function<void(const linkgate::common::Result<std::string>&)>;

    ChunkStream(linkgate::network::EventLoop* loop,
                BackendClientPtr client,
                double timeoutSec,
                int64_t objectId,
                int64_t offset,
                int64_t limit,
                int64_t chunkSize);

    // Fetches the next chunk. At most one fetch may be outstanding.
    void Next(ChunkCallback cb);
    // No fetch is issued afterwards and a pending callback is dropped.
    void Cancel();

    bool done() const { return remaining_ == 0; }
    bool cancelled() const { return cancelled_; }
    int64_t produced() const { return produced_; }
    int64_t fetches() const { return fetches_; }

private:
    void OnBlock(const linkgate::common::Result<std::string>& block, const ChunkCallback& cb);

    linkgate::network::EventLoop* loop_;
    BackendClientPtr client_;
    double timeoutSec_;
    const int64_t objectId_;
    const int64_t chunkSize_;
    int64_t nextBlockOffset_;
    int64_t firstCut_;
    int64_t remaining_;
    int64_t produced_{0};
    int64_t fetches_{0};
    bool inFlight_{false};
    bool cancelled_{false};
};

using ChunkStreamPtr = std::shared_ptr<ChunkStream>;

// Stream-capable adapter around one backend session. Every backend call
// goes through a deadline; 0 disables it.
class ByteStreamer : linkgate::common::noncopyable {
public:
    using StatusCallback = std::function<void(const linkgate::common::Status&)>;

    ByteStreamer(linkgate::network::EventLoop* loop, BackendClientPtr client, double timeoutSec);

    int sessionId() const { return client_->id(); }
    const BackendClientPtr& client() const { return client_; }

    // Starts the session if needed; a failed connect is retried once.
    void EnsureConnected(StatusCallback cb);
    void GetFileInfo(int64_t objectId, BackendClient::FileInfoCallback cb);
    ChunkStreamPtr Stream(int64_t objectId, int64_t offset, int64_t limit, int64_t chunkSize);

private:
    void StartAttempt(int attempt, StatusCallback cb);

    linkgate::network::EventLoop* loop_;
    BackendClientPtr client_;
    double timeoutSec_;
};

using ByteStreamerPtr = std::shared_ptr<ByteStreamer>;

} // namespace backend
} // namespace linkgate
