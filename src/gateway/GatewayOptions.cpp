#include "linkgate/gateway/GatewayOptions.h"
#include "linkgate/common/Config.h"
#include "linkgate/common/Logger.h"

namespace linkgate {
namespace gateway {

const char* DeliveryModeName(DeliveryMode mode) {
    return mode == DeliveryMode::kRedirect ? "redirect" : "proxy";
}

GatewayOptions GatewayOptions::FromConfig(linkgate::common::Config& config) {
    GatewayOptions opts;

    const std::string mode = config.GetString("gateway", "delivery_mode", "proxy");
    if (mode == "redirect") {
        opts.mode = DeliveryMode::kRedirect;
    } else if (mode != "proxy") {
        LOG_WARN << "Unknown gateway.delivery_mode '" << mode << "', using proxy";
    }

    opts.maxConcurrentPerSession = config.GetInt("gateway", "max_concurrent_per_session", opts.maxConcurrentPerSession);
    if (opts.maxConcurrentPerSession <= 0) {
        LOG_WARN << "gateway.max_concurrent_per_session must be positive, using 8";
        opts.maxConcurrentPerSession = 8;
    }

    opts.chunkSize = config.GetInt64("gateway", "chunk_size", opts.chunkSize);
    if (opts.chunkSize <= 0) {
        LOG_WARN << "gateway.chunk_size must be positive, using 1048576";
        opts.chunkSize = 1024 * 1024;
    }

    opts.backendTimeoutSec = config.GetDouble("gateway", "backend_timeout_sec", opts.backendTimeoutSec);
    if (opts.backendTimeoutSec < 0.0) {
        opts.backendTimeoutSec = 0.0;
    }

    opts.projectUrl = config.GetString("gateway", "project_url", opts.projectUrl);
    const std::string versionOverride = config.GetString("gateway", "version_override", "");
    if (!versionOverride.empty()) {
        opts.version = versionOverride;
    }
    opts.botUsername = config.GetString("bot", "username", "");
    opts.previewTemplatePath = config.GetString("preview", "template_path", "");
    return opts;
}

} // namespace gateway
} // namespace linkgate
