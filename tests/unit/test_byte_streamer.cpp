#include "linkgate/backend/ByteStreamer.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/common/Logger.h"
#include "TestSupport.h"

#include <cassert>
#include <memory>
#include <string>

using namespace linkgate::backend;
using namespace linkgate::common;
using linkgate::network::EventLoop;
using linkgate::test::FakeBackendClient;
using linkgate::test::RunUntil;
using linkgate::test::RunFor;

// Pulls the whole window and returns the concatenated bytes.
static std::string drain(EventLoop& loop, const ChunkStreamPtr& stream, bool* failed) {
    std::string out;
    bool waiting = false;
    *failed = false;
    std::function<void()> pull;
    pull = [&]() {
        waiting = true;
        stream->Next([&](const Result<std::string>& chunk) {
            waiting = false;
            if (!chunk.ok()) {
                *failed = true;
                return;
            }
            out += chunk.value();
            if (!stream->done()) pull();
        });
    };
    pull();
    RunUntil(loop, [&]() { return *failed || (!waiting && stream->done()); });
    return out;
}

void testChunkAlignment() {
    EventLoop loop;
    auto client = std::make_shared<FakeBackendClient>(&loop, 1);
    FileInfo info;
    info.uniqueId = "abc123xyz";
    client->AddObject(7, info, 3000000);

    ByteStreamer streamer(&loop, client, 5.0);
    const int64_t chunk = 1024 * 1024;
    auto stream = streamer.Stream(7, 1500000, 1000000, chunk);
    bool failed = false;
    std::string got = drain(loop, stream, &failed);

    assert(!failed);
    assert(got.size() == 1000000);
    assert(got == client->Data(7).substr(1500000, 1000000));
    assert(stream->produced() == 1000000);
    // every request starts on a chunk boundary
    assert(client->reads.size() == 2);
    for (const auto& r : client->reads) {
        assert(r.first % chunk == 0);
        assert(r.second == chunk);
    }
    assert(client->reads[0].first == 1048576);
    LOG_INFO << "Chunk alignment PASS";
}

void testSmallWindows() {
    EventLoop loop;
    auto client = std::make_shared<FakeBackendClient>(&loop, 1);
    client->AddObject(1, FileInfo(), 1000);
    ByteStreamer streamer(&loop, client, 5.0);

    for (int64_t offset : {0, 1, 63, 64, 65, 999}) {
        for (int64_t limit : {1, 2, 64, 200}) {
            if (offset + limit > 1000) continue;
            bool failed = false;
            std::string got = drain(loop, streamer.Stream(1, offset, limit, 64), &failed);
            assert(!failed);
            assert(got == client->Data(1).substr(static_cast<size_t>(offset), static_cast<size_t>(limit)));
        }
    }
    LOG_INFO << "Small windows PASS";
}

void testShortObject() {
    EventLoop loop;
    auto client = std::make_shared<FakeBackendClient>(&loop, 1);
    client->AddObject(1, FileInfo(), 100);
    ByteStreamer streamer(&loop, client, 5.0);

    bool failed = false;
    std::string got = drain(loop, streamer.Stream(1, 0, 500, 64), &failed);
    assert(failed);
    assert(got.size() == 100);
    LOG_INFO << "Short object PASS";
}

void testCancel() {
    EventLoop loop;
    auto client = std::make_shared<FakeBackendClient>(&loop, 1);
    client->AddObject(1, FileInfo(), 1000);
    ByteStreamer streamer(&loop, client, 5.0);

    auto stream = streamer.Stream(1, 0, 1000, 100);
    int calls = 0;
    stream->Next([&](const Result<std::string>&) { ++calls; });
    stream->Cancel();
    stream->Next([&](const Result<std::string>&) { ++calls; });
    RunFor(loop, 0.05);
    assert(calls == 0);
    assert(stream->cancelled());
    assert(client->reads.size() == 1);
    LOG_INFO << "Cancel PASS";
}

void testConnectRetry() {
    EventLoop loop;
    auto client = std::make_shared<FakeBackendClient>(&loop, 3);
    client->SetConnected(false);
    client->failStarts = 1;
    ByteStreamer streamer(&loop, client, 5.0);

    bool done = false;
    Status result;
    streamer.EnsureConnected([&](const Status& s) { result = s; done = true; });
    assert(RunUntil(loop, [&]() { return done; }));
    assert(result.ok());
    assert(client->startCalls == 2);

    // already connected: no Start()
    done = false;
    streamer.EnsureConnected([&](const Status& s) { result = s; done = true; });
    assert(RunUntil(loop, [&]() { return done; }));
    assert(client->startCalls == 2);

    auto dead = std::make_shared<FakeBackendClient>(&loop, 4);
    dead->SetConnected(false);
    dead->failStarts = 5;
    ByteStreamer deadStreamer(&loop, dead, 5.0);
    done = false;
    deadStreamer.EnsureConnected([&](const Status& s) { result = s; done = true; });
    assert(RunUntil(loop, [&]() { return done; }));
    assert(!result.ok());
    assert(result.error().kind == ErrorKind::kBackendUnreachable);
    assert(dead->startCalls == 2);
    LOG_INFO << "Connect retry PASS";
}

void testMetadataDeadline() {
    EventLoop loop;
    auto client = std::make_shared<FakeBackendClient>(&loop, 1);
    client->hangFileInfo = true;
    ByteStreamer streamer(&loop, client, 0.05);

    int calls = 0;
    ErrorKind kind = ErrorKind::kBackendError;
    streamer.GetFileInfo(9, [&](const Result<std::optional<FileInfo>>& r) {
        ++calls;
        if (!r.ok()) kind = r.error().kind;
    });
    assert(RunUntil(loop, [&]() { return calls > 0; }));
    assert(kind == ErrorKind::kBackendTimeout);

    // the late answer is dropped
    assert(client->hungInfo.size() == 1);
    client->hungInfo[0](Result<std::optional<FileInfo>>(std::optional<FileInfo>()));
    RunFor(loop, 0.02);
    assert(calls == 1);
    LOG_INFO << "Metadata deadline PASS";
}

int main() {
    testChunkAlignment();
    testSmallWindows();
    testShortObject();
    testCancel();
    testConnectRetry();
    testMetadataDeadline();
    return 0;
}
