#include "linkgate/backend/ByteStreamer.h"
#include "linkgate/backend/Deadline.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/common/Logger.h"

#include <algorithm>

namespace linkgate {
namespace backend {

using linkgate::common::Error;
using linkgate::common::ErrorKind;
using linkgate::common::Result;
using linkgate::common::Status;

ChunkStream::ChunkStream(linkgate::network::EventLoop* loop,
                         BackendClientPtr client,
                         double timeoutSec,
                         int64_t objectId,
                         int64_t offset,
                         int64_t limit,
                         int64_t chunkSize)
    : loop_(loop),
      client_(std::move(client)),
      timeoutSec_(timeoutSec),
      objectId_(objectId),
      chunkSize_(chunkSize > 0 ? chunkSize : 1024 * 1024),
      nextBlockOffset_(offset - offset % chunkSize_),
      firstCut_(offset % chunkSize_),
      remaining_(limit > 0 ? limit : 0) {
}

void ChunkStream::Next(ChunkCallback cb) {
    if (cancelled_) {
        return;
    }
    if (done()) {
        loop_->QueueInLoop([cb]() { cb(Result<std::string>(std::string())); });
        return;
    }
    if (inFlight_) {
        LOG_ERROR << "ChunkStream: Next() while a fetch is outstanding, object " << objectId_;
        loop_->QueueInLoop([cb]() {
            cb(Result<std::string>(Error(ErrorKind::kBackendError, "concurrent Next()")));
        });
        return;
    }

    inFlight_ = true;
    ++fetches_;
    std::weak_ptr<ChunkStream> weak = shared_from_this();
    auto onBlock = WithDeadline<Result<std::string>>(
        loop_, timeoutSec_, "chunk fetch at " + std::to_string(nextBlockOffset_),
        [weak, cb](const Result<std::string>& block) {
            auto self = weak.lock();
            if (!self || self->cancelled_) return;
            self->OnBlock(block, cb);
        });
    client_->ReadBlock(objectId_, nextBlockOffset_, chunkSize_, onBlock);
}

void ChunkStream::OnBlock(const Result<std::string>& block, const ChunkCallback& cb) {
    inFlight_ = false;
    if (!block.ok()) {
        cb(block);
        return;
    }

    std::string data = block.value();
    nextBlockOffset_ += chunkSize_;
    if (firstCut_ > 0) {
        const size_t cut = static_cast<size_t>(std::min<int64_t>(firstCut_, static_cast<int64_t>(data.size())));
        data.erase(0, cut);
        firstCut_ = 0;
    }
    if (static_cast<int64_t>(data.size()) > remaining_) {
        data.resize(static_cast<size_t>(remaining_));
    }
    if (data.empty()) {
        cb(Result<std::string>(Error(ErrorKind::kBackendError,
            "object " + std::to_string(objectId_) + " ended " + std::to_string(remaining_) + " bytes early")));
        return;
    }
    remaining_ -= static_cast<int64_t>(data.size());
    produced_ += static_cast<int64_t>(data.size());
    cb(Result<std::string>(std::move(data)));
}

void ChunkStream::Cancel() {
    if (!cancelled_) {
        LOG_DEBUG << "ChunkStream: cancelled object " << objectId_ << " after " << produced_ << " bytes";
    }
    cancelled_ = true;
}

ByteStreamer::ByteStreamer(linkgate::network::EventLoop* loop, BackendClientPtr client, double timeoutSec)
    : loop_(loop),
      client_(std::move(client)),
      timeoutSec_(timeoutSec) {
}

void ByteStreamer::EnsureConnected(StatusCallback cb) {
    if (client_->IsConnected()) {
        loop_->QueueInLoop([cb]() { cb(Status::Ok()); });
        return;
    }
    StartAttempt(1, std::move(cb));
}

void ByteStreamer::StartAttempt(int attempt, StatusCallback cb) {
    const int session = client_->id();
    auto onStarted = WithDeadline<Status>(
        loop_, timeoutSec_, "session " + std::to_string(session) + " connect",
        [this, attempt, session, cb](const Status& status) {
            if (status.ok()) {
                if (attempt > 1) {
                    LOG_INFO << "Session " << session << " reconnected on attempt " << attempt;
                }
                cb(status);
                return;
            }
            LOG_WARN << "Session " << session << " connect attempt " << attempt
                     << " failed: " << status.error().detail;
            if (attempt < 2) {
                StartAttempt(attempt + 1, cb);
                return;
            }
            cb(Status(Error(ErrorKind::kBackendUnreachable,
                            "session " + std::to_string(session) + ": " + status.error().detail)));
        });
    client_->Start(onStarted);
}

void ByteStreamer::GetFileInfo(int64_t objectId, BackendClient::FileInfoCallback cb) {
    client_->GetFileInfo(objectId,
        WithDeadline<Result<std::optional<FileInfo>>>(
            loop_, timeoutSec_, "metadata fetch for " + std::to_string(objectId), std::move(cb)));
}

ChunkStreamPtr ByteStreamer::Stream(int64_t objectId, int64_t offset, int64_t limit, int64_t chunkSize) {
    return std::make_shared<ChunkStream>(loop_, client_, timeoutSec_, objectId, offset, limit, chunkSize);
}

} // namespace backend
} // namespace linkgate
