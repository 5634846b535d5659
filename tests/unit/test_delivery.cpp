#include "linkgate/gateway/DeliveryService.h"
#include "linkgate/gateway/GatewayOptions.h"
#include "linkgate/balancer/SessionRegistry.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/common/Logger.h"
#include "TestSupport.h"

#include <cassert>
#include <map>
#include <memory>
#include <sstream>
#include <string>

using namespace linkgate::gateway;
using namespace linkgate::common;
using linkgate::backend::FileInfo;
using linkgate::balancer::SessionRegistry;
using linkgate::network::EventLoop;
using linkgate::test::FakeBackendClient;
using linkgate::test::MakeRequest;
using linkgate::test::MakeWriter;
using linkgate::test::RecordingWriter;
using linkgate::test::RunFor;
using linkgate::test::RunUntil;

namespace {

struct Fixture {
    explicit Fixture(GatewayOptions opts = GatewayOptions(), double timeoutSec = 2.0)
        : registry(&loop, opts.maxConcurrentPerSession, timeoutSec),
          client(std::make_shared<FakeBackendClient>(&loop, 0)),
          options(opts) {
        FileInfo info;
        info.uniqueId = "abc123AAAAAAAAAA";
        info.mimeType = "video/mp4";
        info.fileName = "clip one.mp4";
        client->AddObject(42, info, 5000);
        registry.AddSession(client);
        service.reset(new DeliveryService(registry, options));
    }

    std::shared_ptr<RecordingWriter> Get(const std::string& path,
                                         const std::string& query = std::string(),
                                         const std::map<std::string, std::string>& headers = {}) {
        auto writer = MakeWriter(&loop);
        service->HandleDelivery(MakeRequest("GET", path, query, headers), path, writer);
        bool finished = RunUntil(loop, [&]() { return writer->finished(); });
        assert(finished);
        // let any trailing cleanup run
        RunFor(loop, 0.005);
        return writer;
    }

    EventLoop loop;
    SessionRegistry registry;
    std::shared_ptr<FakeBackendClient> client;
    GatewayOptions options;
    std::unique_ptr<DeliveryService> service;
};

GatewayOptions SmallChunks() {
    GatewayOptions opts;
    opts.chunkSize = 1024;
    return opts;
}

void assertBalanced(Fixture& f) {
    assert(f.registry.Workload(0) == 0);
    assert(f.registry.TotalAcquired() == f.registry.TotalReleased());
}

} // namespace

void testFullObject() {
    Fixture f(SmallChunks());
    auto w = f.Get("/abc12342");

    assert(w->ended);
    assert(w->status() == 206);
    assert(w->header("Content-Range") == "bytes 0-4999/5000");
    assert(w->declaredLength == 5000);
    assert(w->body.size() == 5000);
    assert(w->body == f.client->Data(42));
    assert(w->header("Content-Type") == "video/mp4");
    assert(w->header("Content-Disposition") == "inline; filename*=UTF-8''clip%20one.mp4");
    assert(w->header("Accept-Ranges") == "bytes");
    assert(w->header("Cache-Control") == "no-store");
    assert(w->header("Access-Control-Allow-Origin") == "*");
    assert(w->header("Access-Control-Expose-Headers") == "Content-Length, Content-Range, Content-Disposition");
    assert(w->chunks == 5);
    assert(f.registry.TotalAcquired() == 1);
    assertBalanced(f);
    LOG_INFO << "Full object delivery PASS";
}

void testRangeAndIdFirst() {
    Fixture f(SmallChunks());
    auto w = f.Get("/42", "hash=abc123", {{"Range", "bytes=1000-2999"}});
    assert(w->status() == 206);
    assert(w->header("Content-Range") == "bytes 1000-2999/5000");
    assert(w->declaredLength == 2000);
    assert(w->body == f.client->Data(42).substr(1000, 2000));

    w = f.Get("/abc12342", std::string(), {{"Range", "bytes=4990-"}});
    assert(w->header("Content-Range") == "bytes 4990-4999/5000");
    assert(w->body.size() == 10);
    assertBalanced(f);
    LOG_INFO << "Range delivery PASS";
}

void testHashMismatchLooksLikeNotFound() {
    Fixture f;
    auto mismatch = f.Get("/zzz99942");
    auto missing = f.Get("/abc123999");
    auto invalid = f.Get("/not-a-link");

    assert(mismatch->replied && missing->replied && invalid->replied);
    assert(mismatch->status() == 404);
    assert(mismatch->status() == missing->status());
    assert(mismatch->status() == invalid->status());
    assert(mismatch->body == "Link expired or invalid");
    assert(mismatch->body == missing->body);
    assert(mismatch->body == invalid->body);
    assert(mismatch->header("Content-Type") == missing->header("Content-Type"));
    // the invalid link never bound a session
    assert(f.registry.TotalAcquired() == 2);
    assertBalanced(f);
    LOG_INFO << "Hash mismatch PASS";
}

void testMalformedRange() {
    Fixture f;
    for (const char* range : {"bytes=-200", "bytes=6000-", "bytes=9-3", "pages=1-2"}) {
        auto w = f.Get("/abc12342", std::string(), {{"Range", range}});
        assert(w->status() == 400);
        assert(w->body == "Bad Request");
    }
    assertBalanced(f);
    LOG_INFO << "Malformed range PASS";
}

void testEmptyObject() {
    Fixture f;
    FileInfo info;
    info.uniqueId = "abc123";
    f.client->AddObjectData(7, info, std::string());
    auto w = f.Get("/abc1237");
    assert(w->status() == 404);
    assertBalanced(f);
    LOG_INFO << "Empty object PASS";
}

void testNoSessions() {
    EventLoop loop;
    SessionRegistry registry(&loop, 8, 1.0);
    DeliveryService service(registry, GatewayOptions());
    auto w = MakeWriter(&loop);
    service.HandleDelivery(MakeRequest("GET", "/abc12342"), "/abc12342", w);
    assert(w->replied);
    assert(w->status() == 500);
    assert(w->body == "No clients available");
    LOG_INFO << "No sessions PASS";
}

void testUnreachableBackend() {
    {
        Fixture f;
        f.client->SetConnected(false);
        f.client->failStarts = 10;
        auto w = f.Get("/abc12342");
        assert(w->status() == 404);
        assert(f.client->startCalls == 2);
        assertBalanced(f);
    }
    {
        GatewayOptions redirect;
        redirect.mode = DeliveryMode::kRedirect;
        Fixture f(redirect);
        f.client->SetConnected(false);
        f.client->failStarts = 10;
        auto w = f.Get("/abc12342");
        assert(w->status() == 500);
        assert(w->body == "Internal server error");
        assertBalanced(f);
    }
    {
        // a single failed connect is retried
        Fixture f(SmallChunks());
        f.client->SetConnected(false);
        f.client->failStarts = 1;
        auto w = f.Get("/abc12342");
        assert(w->status() == 206);
        assert(w->body.size() == 5000);
        assertBalanced(f);
    }
    LOG_INFO << "Unreachable backend PASS";
}

void testMetadataTimeout() {
    Fixture f(GatewayOptions(), 0.05);
    f.client->hangFileInfo = true;
    auto w = f.Get("/abc12342");
    assert(w->status() == 404);
    assertBalanced(f);

    // a late answer changes nothing
    assert(f.client->hungInfo.size() == 1);
    f.client->hungInfo[0](Result<std::optional<FileInfo>>(std::optional<FileInfo>()));
    RunFor(f.loop, 0.01);
    assertBalanced(f);
    LOG_INFO << "Metadata timeout PASS";
}

void testRedirectMode() {
    GatewayOptions opts;
    opts.mode = DeliveryMode::kRedirect;
    Fixture f(opts);
    FileInfo info;
    info.uniqueId = "qwe456";
    info.fileUrl = "https://cdn.example.org/files/8?sig=1";
    f.client->AddObject(8, info, 100);

    auto w = f.Get("/qwe4568");
    assert(w->replied);
    assert(w->status() == 302);
    assert(w->header("Location") == "https://cdn.example.org/files/8?sig=1");
    assert(w->header("Access-Control-Allow-Origin") == "*");
    assert(f.client->reads.empty());
    assertBalanced(f);

    // without a direct URL the bytes are proxied
    w = f.Get("/abc12342");
    assert(w->status() == 206);
    assert(w->body.size() == 5000);

    w = f.Get("/zzz99942");
    assert(w->status() == 404);
    assertBalanced(f);
    LOG_INFO << "Redirect mode PASS";
}

void testClientDisconnect() {
    Fixture f(SmallChunks());
    auto w = MakeWriter(&f.loop);
    w->holdDrains = true;
    f.service->HandleDelivery(MakeRequest("GET", "/abc12342"), "/abc12342", w);
    assert(RunUntil(f.loop, [&]() { return w->chunks == 1; }));
    assert(f.registry.Workload(0) == 1);

    w->ReleaseDrain();
    assert(RunUntil(f.loop, [&]() { return w->chunks == 2; }));
    const size_t readsBefore = f.client->reads.size();

    // The held drain is the task's only owner at this point; the abort
    // callback must still reach it.
    std::ostringstream logged;
    Logger::Instance().SetSink(&logged);
    Logger::Instance().SetLevel(LogLevel::INFO);
    w->Disconnect();
    Logger::Instance().SetLevel(LogLevel::WARN);
    Logger::Instance().SetSink(nullptr);
    assert(logged.str().find("client went away at stage Streaming, 2048 bytes sent") != std::string::npos);
    assert(logged.str().find("task dropped") == std::string::npos);
    assert(f.registry.Workload(0) == 0);
    RunFor(f.loop, 0.02);
    assert(f.client->reads.size() == readsBefore);
    assert(w->body.size() == 2048);
    assertBalanced(f);
    LOG_INFO << "Client disconnect PASS";
}

void testDisconnectBeforeMetadata() {
    Fixture f;
    f.client->hangFileInfo = true;
    auto w = MakeWriter(&f.loop);
    f.service->HandleDelivery(MakeRequest("GET", "/abc12342"), "/abc12342", w);
    assert(RunUntil(f.loop, [&]() { return f.client->infoCalls == 1; }));
    assert(f.registry.Workload(0) == 1);
    w->Disconnect();
    assert(f.registry.Workload(0) == 0);
    RunFor(f.loop, 0.01);
    assertBalanced(f);
    LOG_INFO << "Disconnect before metadata PASS";
}

void testMidStreamFailure() {
    Fixture f(SmallChunks());
    f.client->failReadAt = 2048;
    auto w = f.Get("/abc12342");
    assert(w->streaming);
    assert(w->aborted);
    assert(!w->ended);
    assert(w->body.size() == 2048);
    assertBalanced(f);
    LOG_INFO << "Mid-stream failure PASS";
}

void testBackendThrows() {
    {
        // thrown while the request is being dispatched
        Fixture f;
        f.client->SetConnected(false);
        f.client->throwOnStart = true;
        auto w = f.Get("/abc12342");
        assert(w->replied);
        assert(w->status() == 404);
        assert(w->body == "Link expired or invalid");
        assertBalanced(f);
    }
    {
        // thrown from inside a loop callback
        Fixture f;
        f.client->throwOnInfo = true;
        auto w = f.Get("/abc12342");
        assert(w->replied);
        assert(w->status() == 404);
        assert(w->body == "Link expired or invalid");
        assertBalanced(f);
    }
    {
        GatewayOptions redirect;
        redirect.mode = DeliveryMode::kRedirect;
        Fixture f(redirect);
        f.client->throwOnInfo = true;
        auto w = f.Get("/abc12342");
        assert(w->status() == 500);
        assertBalanced(f);
    }
    LOG_INFO << "Backend exception PASS";
}

void testFallbackFileName() {
    Fixture f;
    FileInfo info;
    info.uniqueId = "abc123";
    f.client->AddObject(9, info, 10);
    auto w = f.Get("/abc1239");
    const std::string disposition = w->header("Content-Disposition");
    const std::string prefix = "inline; filename*=UTF-8''file_";
    assert(disposition.compare(0, prefix.size(), prefix) == 0);
    assert(disposition.size() == prefix.size() + 8);
    assert(w->header("Content-Type") == "application/octet-stream");
    LOG_INFO << "Fallback file name PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    testFullObject();
    testRangeAndIdFirst();
    testHashMismatchLooksLikeNotFound();
    testMalformedRange();
    testEmptyObject();
    testNoSessions();
    testUnreachableBackend();
    testMetadataTimeout();
    testRedirectMode();
    testClientDisconnect();
    testDisconnectBeforeMetadata();
    testMidStreamFailure();
    testBackendThrows();
    testFallbackFileName();
    return 0;
}
