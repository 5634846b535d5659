#include "linkgate/gateway/DeliveryService.h"
#include "linkgate/gateway/GatewayError.h"
#include "linkgate/gateway/LinkCodec.h"
#include "linkgate/gateway/RangeNegotiator.h"
#include "linkgate/balancer/SessionRegistry.h"
#include "linkgate/backend/ByteStreamer.h"
#include "linkgate/protocol/HttpRequest.h"
#include "linkgate/protocol/HttpResponse.h"
#include "linkgate/protocol/UrlCodec.h"
#include "linkgate/common/Logger.h"
#include "linkgate/common/Random.h"

#include <exception>
#include <map>
#include <memory>
#include <optional>

namespace linkgate {
namespace gateway {

using linkgate::backend::ByteStreamerPtr;
using linkgate::backend::ChunkStreamPtr;
using linkgate::backend::FileInfo;
using linkgate::balancer::SessionRegistry;
using linkgate::balancer::WorkloadLease;
using linkgate::common::Error;
using linkgate::common::ErrorKind;
using linkgate::common::Result;
using linkgate::common::Status;
using linkgate::protocol::HttpResponse;
using linkgate::protocol::ResponseWriterPtr;
using linkgate::protocol::UrlCodec;

namespace {

enum class Stage {
    kReceived,
    kLinkDecoded,
    kSessionBound,
    kMetadataFetched,
    kHashVerified,
    kRangeNegotiated,
    kStreaming,
    kDone,
    kFailed,
};

const char* StageName(Stage stage) {
    switch (stage) {
        case Stage::kReceived: return "Received";
        case Stage::kLinkDecoded: return "LinkDecoded";
        case Stage::kSessionBound: return "SessionBound";
        case Stage::kMetadataFetched: return "MetadataFetched";
        case Stage::kHashVerified: return "HashVerified";
        case Stage::kRangeNegotiated: return "RangeNegotiated";
        case Stage::kStreaming: return "Streaming";
        case Stage::kDone: return "Done";
        case Stage::kFailed: return "Failed";
    }
    return "Unknown";
}

std::string FallbackFileName() {
    const std::string hex = linkgate::common::RandomHex(4);
    return hex.empty() ? std::string("file") : "file_" + hex;
}

// One delivery request. Kept alive by the callbacks it has in flight.
class DeliveryTask : public std::enable_shared_from_this<DeliveryTask> {
public:
    DeliveryTask(const GatewayOptions& options,
                 std::string label,
                 ResponseWriterPtr writer,
                 std::optional<std::string> rangeHeader)
        : mode_(options.mode),
          chunkSize_(options.chunkSize),
          label_(std::move(label)),
          writer_(std::move(writer)),
          rangeHeader_(std::move(rangeHeader)) {}

    ~DeliveryTask() {
        if (!finished_) {
            LOG_ERROR << label_ << ": task dropped at stage " << StageName(stage_);
        }
    }

    void Run(SessionRegistry& registry, const std::string& path, const std::map<std::string, std::string>& query) {
        Result<LinkRef> link = DecodeLink(path, query);
        if (!link.ok()) {
            Fail(link.error());
            return;
        }
        link_ = link.value();
        stage_ = Stage::kLinkDecoded;

        Result<SessionRegistry::Binding> binding = registry.Acquire();
        if (!binding.ok()) {
            Fail(binding.error());
            return;
        }
        lease_ = std::move(binding.value().lease);
        streamer_ = binding.value().streamer;
        stage_ = Stage::kSessionBound;

        std::weak_ptr<DeliveryTask> weak = shared_from_this();
        writer_->SetAbortCallback([weak]() {
            auto task = weak.lock();
            if (task) task->OnClientGone();
        });

        auto self = shared_from_this();
        streamer_->EnsureConnected([self](const Status& status) {
            self->Guarded("connect", [&]() { self->OnConnected(status); });
        });
    }

    // Fails the task when a backend call throws instead of reporting an error.
    template <typename F>
    void Guarded(const char* step, F&& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            Fail(Error(ErrorKind::kBackendError, std::string(step) + " threw: " + e.what()));
        }
    }

private:
    void OnConnected(const Status& status) {
        if (finished_) return;
        if (!status.ok()) {
            Fail(status.error());
            return;
        }
        auto self = shared_from_this();
        streamer_->GetFileInfo(link_.objectId,
            [self](const Result<std::optional<FileInfo>>& info) {
                self->Guarded("metadata", [&]() { self->OnFileInfo(info); });
            });
    }

    void OnFileInfo(const Result<std::optional<FileInfo>>& result) {
        if (finished_) return;
        if (!result.ok()) {
            Fail(result.error());
            return;
        }
        const std::optional<FileInfo>& info = result.value();
        if (!info || info->fileSize <= 0) {
            Fail(Error(ErrorKind::kObjectNotFound,
                       "object " + std::to_string(link_.objectId) + (info ? " has no content" : " does not exist")));
            return;
        }
        stage_ = Stage::kMetadataFetched;

        if (info->uniqueId.substr(0, kSecretHashLength) != link_.secretHash) {
            Fail(Error(ErrorKind::kUnauthorized,
                       "hash mismatch for object " + std::to_string(link_.objectId)));
            return;
        }
        stage_ = Stage::kHashVerified;

        if (mode_ == DeliveryMode::kRedirect && !info->fileUrl.empty()) {
            HttpResponse response(false);
            response.setStatusCode(HttpResponse::k302Found);
            response.addHeader("Location", info->fileUrl);
            ApplyCorsHeaders(&response);
            writer_->Reply(response);
            LOG_INFO << label_ << " -> 302 direct URL via session " << lease_.sessionId();
            Finish(Stage::kDone);
            return;
        }

        Result<ByteRange> range = NegotiateRange(rangeHeader_, info->fileSize);
        if (!range.ok()) {
            Fail(range.error());
            return;
        }
        stage_ = Stage::kRangeNegotiated;
        StartBody(*info, range.value());
    }

    void StartBody(const FileInfo& info, const ByteRange& range) {
        HttpResponse head(false);
        head.setStatusCode(HttpResponse::k206PartialContent);
        head.setContentType(info.mimeType.empty() ? "application/octet-stream" : info.mimeType);
        const std::string name = info.fileName.empty() ? FallbackFileName() : info.fileName;
        head.addHeader("Content-Disposition", "inline; filename*=" + UrlCodec::EncodeExtValue(name));
        head.addHeader("Accept-Ranges", "bytes");
        head.addHeader("Cache-Control", "no-store");
        head.addHeader("Content-Range", "bytes " + std::to_string(range.start) + "-" +
                                        std::to_string(range.end) + "/" + std::to_string(info.fileSize));
        ApplyCorsHeaders(&head);

        range_ = range;
        total_ = info.fileSize;
        writer_->BeginStream(head, static_cast<uint64_t>(range.length()));
        headSent_ = true;
        if (finished_) return; // peer vanished while the head was written
        stage_ = Stage::kStreaming;

        stream_ = streamer_->Stream(link_.objectId, range.start, range.length(), chunkSize_);
        PumpNext();
    }

    void PumpNext() {
        auto self = shared_from_this();
        stream_->Next([self](const Result<std::string>& chunk) {
            self->Guarded("read", [&]() { self->OnChunk(chunk); });
        });
    }

    void OnChunk(const Result<std::string>& chunk) {
        if (finished_) return;
        if (!chunk.ok()) {
            Fail(chunk.error());
            return;
        }
        if (stream_->done()) {
            writer_->WriteChunk(chunk.value(), nullptr);
            writer_->EndStream();
            LOG_INFO << label_ << " -> 206 bytes " << range_.start << "-" << range_.end << "/" << total_
                     << " via session " << lease_.sessionId();
            Finish(Stage::kDone);
            return;
        }
        auto self = shared_from_this();
        writer_->WriteChunk(chunk.value(), [self]() {
            if (!self->finished_) self->Guarded("read", [&]() { self->PumpNext(); });
        });
    }

    void OnClientGone() {
        if (finished_) return;
        LOG_INFO << label_ << ": client went away at stage " << StageName(stage_)
                 << (stream_ ? ", " + std::to_string(stream_->produced()) + " bytes sent" : std::string());
        Finish(Stage::kFailed);
    }

    void Fail(const Error& error) {
        if (finished_) return;
        const bool operational = error.kind == ErrorKind::kNoSessionsAvailable ||
                                 error.kind == ErrorKind::kBackendUnreachable ||
                                 error.kind == ErrorKind::kBackendTimeout ||
                                 error.kind == ErrorKind::kBackendError;
        if (operational) {
            LOG_ERROR << label_ << " failed at stage " << StageName(stage_) << ": "
                      << linkgate::common::ErrorKindName(error.kind) << ": " << error.detail;
        } else {
            LOG_WARN << label_ << " rejected at stage " << StageName(stage_) << ": "
                     << linkgate::common::ErrorKindName(error.kind) << ": " << error.detail;
        }

        if (headSent_) {
            // Status already on the wire; dropping the connection is the only signal left.
            writer_->AbortStream();
        } else {
            writer_->Reply(MakeErrorResponse(error, mode_));
        }
        Finish(Stage::kFailed);
    }

    void Finish(Stage stage) {
        if (finished_) return;
        finished_ = true;
        stage_ = stage;
        if (stream_ && !stream_->done()) {
            stream_->Cancel();
        }
        if (lease_.held()) {
            LOG_DEBUG << label_ << ": releasing session " << lease_.sessionId();
            lease_.Release();
        }
    }

    const DeliveryMode mode_;
    const int64_t chunkSize_;
    const std::string label_;
    ResponseWriterPtr writer_;
    std::optional<std::string> rangeHeader_;

    Stage stage_{Stage::kReceived};
    bool finished_{false};
    bool headSent_{false};
    LinkRef link_;
    WorkloadLease lease_;
    ByteStreamerPtr streamer_;
    ChunkStreamPtr stream_;
    ByteRange range_;
    int64_t total_{0};
};

} // namespace

DeliveryService::DeliveryService(SessionRegistry& registry, const GatewayOptions& options)
    : registry_(registry),
      options_(options) {
}

void DeliveryService::HandleDelivery(const linkgate::protocol::HttpRequest& req,
                                     const std::string& tokenPath,
                                     const ResponseWriterPtr& writer) {
    std::optional<std::string> range;
    if (req.hasHeader("Range")) {
        range = req.getHeader("Range");
    }
    auto task = std::make_shared<DeliveryTask>(
        options_, req.methodString() + " " + req.path(), writer, std::move(range));
    task->Guarded("dispatch", [&]() { task->Run(registry_, tokenPath, UrlCodec::ParseQuery(req.query())); });
}

} // namespace gateway
} // namespace linkgate
