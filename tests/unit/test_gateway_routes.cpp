#include "linkgate/gateway/GatewayServer.h"
#include "linkgate/gateway/PreviewRenderer.h"
#include "linkgate/balancer/SessionRegistry.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/network/InetAddress.h"
#include "linkgate/common/Logger.h"
#include "TestSupport.h"

#include <cassert>
#include <memory>
#include <string>

using namespace linkgate::gateway;
using namespace linkgate::common;
using linkgate::backend::FileInfo;
using linkgate::balancer::SessionRegistry;
using linkgate::network::EventLoop;
using linkgate::network::InetAddress;
using linkgate::test::FakeBackendClient;
using linkgate::test::Inflate;
using linkgate::test::MakeRequest;
using linkgate::test::MakeWriter;
using linkgate::test::RecordingWriter;
using linkgate::test::RunUntil;

namespace {

struct RenderCall {
    int64_t objectId{0};
    std::string hash;
    std::string action;
    int count{0};
};

class RecordingRenderer : public PreviewRenderer {
public:
    explicit RecordingRenderer(RenderCall* call) : call_(call) {}

    std::string Render(int64_t objectId, const std::string& secretHash, const std::string& action) override {
        call_->objectId = objectId;
        call_->hash = secretHash;
        call_->action = action;
        ++call_->count;
        return "<html>preview " + std::to_string(objectId) + "</html>";
    }

private:
    RenderCall* call_;
};

bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

void assertCors(const RecordingWriter& w) {
    assert(w.header("Access-Control-Allow-Origin") == "*");
    assert(w.header("Access-Control-Allow-Methods") == "GET, OPTIONS");
    assert(w.header("Access-Control-Allow-Headers") == "Range, Content-Type, *");
    assert(w.header("Access-Control-Expose-Headers") == "Content-Length, Content-Range, Content-Disposition");
}

} // namespace

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);

    EventLoop loop;
    SessionRegistry registry(&loop, 8, 2.0);
    auto client = std::make_shared<FakeBackendClient>(&loop, 0);
    FileInfo info;
    info.uniqueId = "abc123zzz";
    info.mimeType = "text/plain";
    info.fileName = "a.txt";
    client->AddObject(42, info, 300);
    registry.AddSession(client);

    GatewayOptions opts;
    opts.botUsername = "linkgate_bot";
    opts.version = "9.9.9";
    opts.projectUrl = "https://example.org/linkgate";

    RenderCall call;
    GatewayServer server(&loop, InetAddress(0, true), registry, opts,
                         PreviewRendererPtr(new RecordingRenderer(&call)));

    {
        auto w = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("HEAD", "/abc12342"), w);
        assert(w->replied);
        assert(w->status() == 405);
        assert(w->header("Allow") == "GET, OPTIONS");
        assert(client->infoCalls == 0);
        assertCors(*w);
        LOG_INFO << "HEAD rejected PASS";
    }
    {
        // HEAD on the page routes answers like GET without a body
        auto status = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("HEAD", "/status"), status);
        assert(status->ended);
        assert(status->status() == 200);
        assert(status->header("Content-Type") == "application/json");
        assert(status->declaredLength == server.StatusJson().size());
        assert(status->body.empty());

        auto root = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("HEAD", "/"), root);
        assert(root->ended);
        assert(root->status() == 302);
        assert(root->header("Location") == "https://example.org/linkgate");

        auto watch = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("HEAD", "/watch/abc12342"), watch);
        assert(watch->ended);
        assert(watch->status() == 200);
        assert(watch->declaredLength == std::string("<html>preview 42</html>").size());
        assert(watch->body.empty());
        assert(call.count == 1);
        call = RenderCall();
        assert(client->infoCalls == 0);
        LOG_INFO << "HEAD on page routes PASS";
    }
    {
        auto w = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("GET", "/"), w);
        assert(w->status() == 302);
        assert(w->header("Location") == "https://example.org/linkgate");
        LOG_INFO << "Root redirect PASS";
    }
    {
        auto w = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("GET", "/status"), w);
        assert(w->status() == 200);
        assert(w->header("Content-Type") == "application/json");
        assert(w->header("Content-Encoding").empty());
        const std::string& json = w->body;
        assert(contains(json, "\"server\":{\"status\":\"operational\",\"version\":\"9.9.9\",\"uptime\":\""));
        assert(contains(json, "\"bot\":{\"username\":\"@linkgate_bot\",\"active_clients\":1}"));
        assert(json == server.StatusJson());
        assertCors(*w);

        auto gz = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("GET", "/status", "", {{"Accept-Encoding", "gzip, deflate"}}), gz);
        assert(gz->header("Content-Encoding") == "gzip");
        assert(gz->header("Vary") == "Accept-Encoding");
        assert(contains(Inflate(gz->body, true), "\"active_clients\":1"));

        auto df = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("GET", "/status", "", {{"Accept-Encoding", "deflate"}}), df);
        assert(df->header("Content-Encoding") == "deflate");
        assert(contains(Inflate(df->body, false), "\"active_clients\":1"));
        LOG_INFO << "Status PASS";
    }
    {
        auto w = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("OPTIONS", "/anything/at/all"), w);
        assert(w->status() == 200);
        assert(w->body.empty());
        assert(w->header("Access-Control-Max-Age") == "86400");
        assertCors(*w);
        LOG_INFO << "Preflight PASS";
    }
    {
        auto w = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("GET", "/watch/abc12342"), w);
        assert(w->status() == 200);
        assert(contains(w->header("Content-Type"), "text/html"));
        assert(w->body == "<html>preview 42</html>");
        assert(call.count == 1);
        assert(call.objectId == 42);
        assert(call.hash == "abc123");
        assert(call.action == "stream");

        auto byQuery = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("GET", "/watch/42", "hash=xyz789"), byQuery);
        assert(byQuery->status() == 200);
        assert(call.hash == "xyz789");

        auto bad = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("GET", "/watch/garbage"), bad);
        assert(bad->status() == 404);
        assert(bad->body == "Link expired or invalid");
        assert(call.count == 2);
        LOG_INFO << "Preview PASS";
    }
    {
        for (const char* method : {"POST", "PUT", "DELETE", "PATCH"}) {
            auto w = MakeWriter(&loop);
            server.HandleRequest(MakeRequest(method, "/abc12342"), w);
            assert(w->status() == 405);
        }
        LOG_INFO << "Other methods PASS";
    }
    {
        auto w = MakeWriter(&loop);
        server.HandleRequest(MakeRequest("GET", "/abc12342", "", {{"Range", "bytes=0-99"}}), w);
        assert(RunUntil(loop, [&]() { return w->finished(); }));
        assert(w->status() == 206);
        assert(w->header("Content-Range") == "bytes 0-99/300");
        assert(w->body == client->Data(42).substr(0, 100));
        assert(registry.Workload(0) == 0);
        LOG_INFO << "Delivery route PASS";
    }
    {
        // the built-in page links back to the stream URL, escaped
        TemplatePreviewRenderer builtin;
        assert(builtin.usingBuiltin());
        const std::string page = builtin.Render(42, "abc123", "stream");
        assert(contains(page, "src=\"/abc12342\""));
        assert(contains(page, "File 42"));
        assert(TemplatePreviewRenderer::HtmlEscape("<a href=\"x\">&'") == "&lt;a href=&quot;x&quot;&gt;&amp;&#39;");
        TemplatePreviewRenderer missing("/nonexistent/preview.html");
        assert(missing.usingBuiltin());
        LOG_INFO << "Built-in preview PASS";
    }
    return 0;
}
