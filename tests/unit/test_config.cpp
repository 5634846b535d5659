#include "linkgate/common/Config.h"
#include "linkgate/gateway/GatewayOptions.h"
#include "linkgate/common/Logger.h"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace linkgate::common;
using namespace linkgate::gateway;

void testParse() {
    Config& conf = Config::Instance();
    assert(conf.LoadFromString(
        "log_level = DEBUG\n"
        "# comment\n"
        "; another\n"
        "[gateway]\n"
        "  delivery_mode =  redirect  \n"
        "chunk_size = 65536\n"
        "enabled = yes\n"
        "bad_int = twelve\n"
        "[session:2]\n"
        "root = /srv/b\n"
        "[session:1]\n"
        "type = local\n"
        "root = /srv/a\n"
        "[session:x]\n"
        "root = /nope\n"));

    assert(conf.GetString("global", "log_level") == "DEBUG");
    assert(conf.GetString("gateway", "delivery_mode") == "redirect");
    assert(conf.GetInt64("gateway", "chunk_size") == 65536);
    assert(conf.GetBool("gateway", "enabled"));
    assert(conf.GetInt("gateway", "bad_int", 7) == 7);
    assert(conf.GetString("missing", "key", "dflt") == "dflt");

    auto sessions = conf.GetSessions();
    assert(sessions.size() == 2);
    assert(sessions[0].id == 1 && sessions[0].root == "/srv/a" && sessions[0].type == "local");
    assert(sessions[1].id == 2 && sessions[1].root == "/srv/b" && sessions[1].type == "local");
    LOG_INFO << "Config parse PASS";
}

void testGatewayOptions() {
    Config& conf = Config::Instance();
    conf.LoadFromString("");
    GatewayOptions defaults = GatewayOptions::FromConfig(conf);
    assert(defaults.mode == DeliveryMode::kProxy);
    assert(defaults.maxConcurrentPerSession == 8);
    assert(defaults.chunkSize == 1024 * 1024);
    assert(defaults.backendTimeoutSec == 30.0);
    assert(defaults.version == LINKGATE_VERSION);
    assert(defaults.botUsername.empty());

    conf.LoadFromString(
        "[gateway]\n"
        "delivery_mode = redirect\n"
        "max_concurrent_per_session = 3\n"
        "chunk_size = 4096\n"
        "backend_timeout_sec = 2.5\n"
        "project_url = https://example.org\n"
        "version_override = 2.0-test\n"
        "[bot]\n"
        "username = files_bot\n"
        "[preview]\n"
        "template_path = /tmp/t.html\n");
    GatewayOptions opts = GatewayOptions::FromConfig(conf);
    assert(opts.mode == DeliveryMode::kRedirect);
    assert(opts.maxConcurrentPerSession == 3);
    assert(opts.chunkSize == 4096);
    assert(opts.backendTimeoutSec == 2.5);
    assert(opts.projectUrl == "https://example.org");
    assert(opts.version == "2.0-test");
    assert(opts.botUsername == "files_bot");
    assert(opts.previewTemplatePath == "/tmp/t.html");

    // invalid values fall back to defaults
    conf.LoadFromString(
        "[gateway]\n"
        "delivery_mode = teleport\n"
        "max_concurrent_per_session = 0\n"
        "chunk_size = -1\n"
        "backend_timeout_sec = -3\n");
    opts = GatewayOptions::FromConfig(conf);
    assert(opts.mode == DeliveryMode::kProxy);
    assert(opts.maxConcurrentPerSession == 8);
    assert(opts.chunkSize == 1024 * 1024);
    assert(opts.backendTimeoutSec == 0.0);
    LOG_INFO << "Gateway options PASS";
}

void testLoadFile() {
    char path[] = "/tmp/linkgate_conf_XXXXXX";
    int fd = ::mkstemp(path);
    assert(fd >= 0);
    ::close(fd);
    {
        std::ofstream out(path);
        out << "[global]\nlisten_port = 9090\n";
    }
    Config& conf = Config::Instance();
    assert(conf.Load(path));
    assert(conf.GetInt("global", "listen_port") == 9090);
    assert(conf.LoadedFilename() && *conf.LoadedFilename() == path);
    assert(!conf.Load("/nonexistent/linkgate.conf"));
    std::remove(path);
    LOG_INFO << "Config file PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParse();
    testGatewayOptions();
    testLoadFile();
    return 0;
}
