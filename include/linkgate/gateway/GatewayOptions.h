#pragma once

#include <cstdint>
#include <string>

#ifndef LINKGATE_VERSION
#define LINKGATE_VERSION "1.0.0"
#endif

namespace linkgate {
namespace common {
class Config;
}

namespace gateway {

enum class DeliveryMode {
    kProxy,    // 206 with the bytes relayed through the gateway
    kRedirect, // 302 to the backend's direct URL when it has one
};

const char* DeliveryModeName(DeliveryMode mode);

struct GatewayOptions {
    DeliveryMode mode{DeliveryMode::kProxy};
    int maxConcurrentPerSession{8};
    int64_t chunkSize{1024 * 1024};
    double backendTimeoutSec{30.0};
    std::string projectUrl{"https://github.com/fyaz05/FileToLink"};
    std::string version{LINKGATE_VERSION};
    std::string botUsername;
    std::string previewTemplatePath;

    static GatewayOptions FromConfig(linkgate::common::Config& config);
};

} // namespace gateway
} // namespace linkgate
