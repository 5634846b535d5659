#include "linkgate/gateway/GatewayServer.h"
#include "linkgate/gateway/GatewayOptions.h"
#include "linkgate/balancer/SessionRegistry.h"
#include "linkgate/backend/LocalStoreClient.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/network/InetAddress.h"
#include "linkgate/common/Logger.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace linkgate;
using namespace linkgate::network;
using namespace linkgate::common;

namespace {

const int kObjectSize = 3 * 1024 * 1024 + 123;

struct ParsedResponse {
    int status{0};
    std::string head;
    std::string body;

    std::string header(const std::string& name) const {
        const std::string key = "\r\n" + name + ": ";
        size_t pos = head.find(key);
        if (pos == std::string::npos) return std::string();
        pos += key.size();
        return head.substr(pos, head.find("\r\n", pos) - pos);
    }
};

int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

void sendAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, 0);
        assert(n > 0);
        sent += static_cast<size_t>(n);
    }
}

std::string recvUntilClose(int fd, int timeoutMs = 5000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[65536];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

// Splits a byte stream of Content-Length framed responses.
std::vector<ParsedResponse> parseResponses(const std::string& raw) {
    std::vector<ParsedResponse> out;
    size_t pos = 0;
    while (pos < raw.size()) {
        size_t end = raw.find("\r\n\r\n", pos);
        assert(end != std::string::npos);
        ParsedResponse r;
        r.head = raw.substr(pos, end + 2 - pos);
        r.status = std::atoi(r.head.c_str() + 9);
        const size_t length = static_cast<size_t>(std::atoll(r.header("Content-Length").c_str()));
        r.body = raw.substr(end + 4, length);
        assert(r.body.size() == length);
        out.push_back(r);
        pos = end + 4 + length;
    }
    return out;
}

std::string makeStore() {
    char dir[] = "/tmp/linkgate_it_XXXXXX";
    assert(::mkdtemp(dir) != nullptr);
    const std::string root(dir);
    {
        std::ofstream meta(root + "/77.meta");
        meta << "unique_id = Zx9_-kQQQQQ\n"
             << "mime_type = video/mp4\n"
             << "file_name = big movie.mp4\n";
    }
    {
        std::ofstream data(root + "/77.data", std::ios::binary);
        for (int i = 0; i < kObjectSize; ++i) {
            data.put(static_cast<char>(i % 251));
        }
    }
    return root;
}

bool bytesMatch(const std::string& body, int64_t offset) {
    for (size_t i = 0; i < body.size(); ++i) {
        if (static_cast<unsigned char>(body[i]) != (offset + static_cast<int64_t>(i)) % 251) return false;
    }
    return true;
}

bool waitFor(const std::function<bool()>& pred, int timeoutMs) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    const std::string root = makeStore();

    EventLoop loop;
    gateway::GatewayOptions opts;
    opts.chunkSize = 64 * 1024;
    opts.botUsername = "it_bot";

    balancer::SessionRegistry registry(&loop, opts.maxConcurrentPerSession, 5.0);
    registry.AddSession(std::make_shared<backend::LocalStoreClient>(&loop, 1, root));

    gateway::GatewayServer server(&loop, InetAddress(0, true), registry, opts, gateway::PreviewRendererPtr());
    server.Start();
    const uint16_t port = server.ListenAddress().toPort();
    assert(port != 0);

    std::thread client([&]() {
        // pipelined: status, ranged delivery, full delivery, hash mismatch
        {
            int fd = connectTo(port);
            sendAll(fd,
                "GET /status HTTP/1.1\r\nHost: t\r\n\r\n"
                "GET /Zx9_-k77 HTTP/1.1\r\nHost: t\r\nRange: bytes=1048500-1048699\r\n\r\n"
                "GET /77?hash=Zx9_-k HTTP/1.1\r\nHost: t\r\n\r\n"
                "GET /zzzzzz77 HTTP/1.1\r\nHost: t\r\nConnection: close\r\n\r\n");
            std::string raw = recvUntilClose(fd);
            ::close(fd);

            std::vector<ParsedResponse> rs = parseResponses(raw);
            assert(rs.size() == 4);

            assert(rs[0].status == 200);
            assert(rs[0].body.find("\"active_clients\":1") != std::string::npos);
            assert(rs[0].body.find("\"username\":\"@it_bot\"") != std::string::npos);

            assert(rs[1].status == 206);
            assert(rs[1].header("Content-Range") == "bytes 1048500-1048699/" + std::to_string(kObjectSize));
            assert(rs[1].body.size() == 200);
            assert(bytesMatch(rs[1].body, 1048500));
            assert(rs[1].header("Content-Disposition") == "inline; filename*=UTF-8''big%20movie.mp4");
            assert(rs[1].header("Access-Control-Allow-Origin") == "*");

            assert(rs[2].status == 206);
            assert(rs[2].body.size() == static_cast<size_t>(kObjectSize));
            assert(bytesMatch(rs[2].body, 0));

            assert(rs[3].status == 404);
            assert(rs[3].body == "Link expired or invalid");
            LOG_INFO << "Pipelined delivery PASS";
        }

        // HEAD and preflight
        {
            int fd = connectTo(port);
            sendAll(fd,
                "HEAD /Zx9_-k77 HTTP/1.1\r\nHost: t\r\n\r\n"
                "OPTIONS /Zx9_-k77 HTTP/1.1\r\nHost: t\r\nConnection: close\r\n\r\n");
            std::vector<ParsedResponse> rs = parseResponses(recvUntilClose(fd));
            ::close(fd);
            assert(rs.size() == 2);
            assert(rs[0].status == 405);
            assert(rs[0].header("Allow") == "GET, OPTIONS");
            assert(rs[1].status == 200);
            assert(rs[1].header("Access-Control-Max-Age") == "86400");
            LOG_INFO << "HEAD and OPTIONS PASS";
        }

        // the client walks away in the middle of a large body
        {
            int fd = connectTo(port);
            sendAll(fd, "GET /Zx9_-k77 HTTP/1.1\r\nHost: t\r\n\r\n");
            char buf[4096];
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            assert(n > 0);
            assert(std::strncmp(buf, "HTTP/1.1 206", 12) == 0);
            ::close(fd);

            assert(waitFor([&]() { return registry.Workload(1) == 0; }, 3000));
            LOG_INFO << "Client disconnect PASS";
        }

        assert(registry.TotalAcquired() == registry.TotalReleased());
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();

    std::remove((root + "/77.meta").c_str());
    std::remove((root + "/77.data").c_str());
    ::rmdir(root.c_str());
    return 0;
}
