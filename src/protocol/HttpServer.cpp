#include "linkgate/protocol/HttpServer.h"
#include "linkgate/protocol/HttpContext.h"
#include "linkgate/protocol/HttpRequest.h"
#include "linkgate/protocol/HttpResponse.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/common/Logger.h"

#include <exception>
#include <memory>

namespace linkgate {
namespace protocol {

using linkgate::network::TcpConnectionPtr;

namespace {

class ConnectionWriter;

struct HttpConnectionState {
    HttpContext context;
    std::shared_ptr<ConnectionWriter> active;
    bool dispatching{false};
};

using HttpConnectionStatePtr = std::shared_ptr<HttpConnectionState>;

HttpConnectionStatePtr GetState(const TcpConnectionPtr& conn) {
    auto* state = std::any_cast<HttpConnectionStatePtr>(conn->GetMutableContext());
    return state ? *state : HttpConnectionStatePtr();
}

// Writes one response onto a TcpConnection. Lives in HttpConnectionState
// while the response is active.
class ConnectionWriter : public ResponseWriter,
                         public std::enable_shared_from_this<ConnectionWriter> {
public:
    using FinishCallback = std::function<void(const TcpConnectionPtr&, bool close)>;

    ConnectionWriter(const TcpConnectionPtr& conn, bool keepAlive, FinishCallback onFinish)
        : conn_(conn), keepAlive_(keepAlive), onFinish_(std::move(onFinish)) {}

    void Reply(const HttpResponse& response) override {
        auto conn = Writable();
        if (!conn || state_ != kIdle) return;
        HttpResponse copy(response);
        if (!keepAlive_) copy.setCloseConnection(true);
        linkgate::network::Buffer buf;
        copy.appendToBuffer(&buf);
        conn->Send(buf.Peek(), buf.ReadableBytes());
        Finish(conn, copy.closeConnection());
    }

    void BeginStream(const HttpResponse& head, uint64_t contentLength) override {
        auto conn = Writable();
        if (!conn || state_ != kIdle) return;
        HttpResponse copy(head);
        if (!keepAlive_) copy.setCloseConnection(true);
        closeAfter_ = copy.closeConnection();
        linkgate::network::Buffer buf;
        copy.appendHeadToBuffer(&buf, contentLength);
        conn->Send(buf.Peek(), buf.ReadableBytes());
        state_ = kStreaming;
    }

    void WriteChunk(const std::string& data, DrainCallback onDrained) override {
        auto conn = Writable();
        if (!conn || state_ != kStreaming) return;
        pendingDrain_ = std::move(onDrained);
        conn->Send(data);
    }

    void EndStream() override {
        auto conn = Writable();
        if (!conn || state_ != kStreaming) return;
        Finish(conn, closeAfter_);
    }

    void AbortStream() override {
        if (state_ == kDone || state_ == kAborted) return;
        state_ = kAborted;
        pendingDrain_ = nullptr;
        abortCallback_ = nullptr;
        auto conn = conn_.lock();
        if (conn) {
            LOG_DEBUG << "HttpServer: aborting response on " << conn->name();
            conn->ForceClose();
        }
    }

    void SetAbortCallback(AbortCallback cb) override {
        abortCallback_ = std::move(cb);
    }

    bool IsAborted() const override { return state_ == kAborted; }
    bool IsFinished() const override { return state_ == kDone || state_ == kAborted; }

    void OnWriteComplete(const TcpConnectionPtr& conn) {
        if (state_ != kStreaming || !pendingDrain_ || conn->OutputBytes() > 0) return;
        DrainCallback cb;
        cb.swap(pendingDrain_);
        cb();
    }

    void OnDisconnect() {
        if (state_ == kDone || state_ == kAborted) return;
        state_ = kAborted;
        AbortCallback cb;
        cb.swap(abortCallback_);
        // The drain callback may hold the last reference to the abort target.
        DrainCallback drain;
        drain.swap(pendingDrain_);
        if (cb) cb();
    }

private:
    enum State { kIdle, kStreaming, kDone, kAborted };

    TcpConnectionPtr Writable() {
        auto conn = conn_.lock();
        if (!conn || !conn->connected()) {
            // Peer is gone; the disconnect notification may still be queued.
            OnDisconnect();
            return TcpConnectionPtr();
        }
        return conn;
    }

    void Finish(const TcpConnectionPtr& conn, bool close) {
        state_ = kDone;
        pendingDrain_ = nullptr;
        abortCallback_ = nullptr;
        FinishCallback cb;
        cb.swap(onFinish_);
        if (cb) cb(conn, close);
    }

    std::weak_ptr<linkgate::network::TcpConnection> conn_;
    bool keepAlive_;
    bool closeAfter_{false};
    State state_{kIdle};
    DrainCallback pendingDrain_;
    AbortCallback abortCallback_;
    FinishCallback onFinish_;
};

} // namespace

HttpServer::HttpServer(linkgate::network::EventLoop* loop,
                       const linkgate::network::InetAddress& listenAddr,
                       const std::string& name,
                       linkgate::network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option) {
    server_.SetConnectionCallback(
        [this](const TcpConnectionPtr& conn) { onConnection(conn); });
    server_.SetMessageCallback(
        [this](const TcpConnectionPtr& conn, linkgate::network::Buffer* buf,
               std::chrono::system_clock::time_point t) { onMessage(conn, buf, t); });
    server_.SetWriteCompleteCallback(
        [this](const TcpConnectionPtr& conn) { onWriteComplete(conn); });
}

void HttpServer::start() {
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on "
             << server_.ListenAddress().toIpPort();
    server_.Start();
}

void HttpServer::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(std::make_shared<HttpConnectionState>());
        return;
    }
    auto state = GetState(conn);
    if (state && state->active) {
        auto writer = std::move(state->active);
        state->active.reset();
        writer->OnDisconnect();
    }
}

void HttpServer::onMessage(const TcpConnectionPtr& conn,
                           linkgate::network::Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    (void)buf;
    (void)receiveTime;
    processBuffered(conn);
}

void HttpServer::onWriteComplete(const TcpConnectionPtr& conn) {
    auto state = GetState(conn);
    if (state && state->active) {
        std::shared_ptr<ConnectionWriter> writer = state->active;
        writer->OnWriteComplete(conn);
    }
}

void HttpServer::processBuffered(const TcpConnectionPtr& conn) {
    auto state = GetState(conn);
    if (!state || state->dispatching) return;
    state->dispatching = true;

    linkgate::network::Buffer* buf = conn->InputBuffer();
    while (!state->active && conn->connected() && buf->ReadableBytes() > 0) {
        HttpContext& context = state->context;
        if (!context.parseRequest(buf, std::chrono::system_clock::now())) {
            LOG_WARN << "HttpServer: malformed request from " << conn->peerAddress().toIpPort();
            HttpResponse bad(true);
            bad.setStatusCode(HttpResponse::k400BadRequest);
            bad.setContentType("text/plain; charset=utf-8");
            bad.setBody("Bad Request");
            linkgate::network::Buffer out;
            bad.appendToBuffer(&out);
            conn->Send(out.Peek(), out.ReadableBytes());
            conn->Shutdown();
            buf->RetrieveAll();
            break;
        }
        if (!context.gotAll()) {
            break;
        }

        HttpRequest req;
        req.swap(context.request());
        context.reset();

        std::weak_ptr<HttpConnectionState> weakState = state;
        auto writer = std::make_shared<ConnectionWriter>(
            conn, req.keepAlive(),
            [this, weakState](const TcpConnectionPtr& c, bool close) {
                auto st = weakState.lock();
                if (st) st->active.reset();
                if (close) {
                    c->Shutdown();
                } else if (st && !st->dispatching) {
                    c->getLoop()->QueueInLoop([this, c]() { processBuffered(c); });
                }
            });
        state->active = writer;
        onRequest(conn, req, writer);
    }

    state->dispatching = false;
}

void HttpServer::onRequest(const TcpConnectionPtr& conn,
                           const HttpRequest& req,
                           const ResponseWriterPtr& writer) {
    LOG_DEBUG << "HttpServer: " << req.methodString() << " " << req.path()
              << " from " << conn->peerAddress().toIpPort();
    try {
        if (httpCallback_) {
            httpCallback_(req, writer);
            return;
        }
        HttpResponse response(false);
        response.setStatusCode(HttpResponse::k404NotFound);
        writer->Reply(response);
    } catch (const std::exception& e) {
        LOG_ERROR << "HttpServer: handler for " << req.path() << " threw: " << e.what();
        if (!writer->IsFinished()) {
            HttpResponse response(true);
            response.setStatusCode(HttpResponse::k500InternalServerError);
            response.setContentType("text/plain; charset=utf-8");
            response.setBody("Internal server error");
            writer->Reply(response);
            // Head already sent: the only option left is dropping the connection.
            if (!writer->IsFinished()) {
                writer->AbortStream();
            }
        }
    }
}

} // namespace protocol
} // namespace linkgate
