#pragma once

#include "linkgate/common/Result.h"
#include "linkgate/network/EventLoop.h"

#include <cstdio>
#include <functional>
#include <memory>
#include <string>

namespace linkgate {
namespace backend {

// Wraps cb so that it runs exactly once: with the backend's answer, or with
// kBackendTimeout after timeoutSec. Whichever comes second is dropped.
// Loop thread only.
template <typename R>
std::function<void(const R&)> WithDeadline(linkgate::network::EventLoop* loop,
                                           double timeoutSec,
                                           const std::string& what,
                                           std::function<void(const R&)> cb) {
    struct Once {
        std::function<void(const R&)> cb;
        linkgate::network::TimerId timer{0};
    };
    auto once = std::make_shared<Once>();
    once->cb = std::move(cb);

    if (timeoutSec > 0.0) {
        char limit[32];
        std::snprintf(limit, sizeof limit, "%.1fs", timeoutSec);
        std::string detail = what + " timed out after " + limit;
        once->timer = loop->RunAfter(timeoutSec, [once, detail]() {
            once->timer = 0;
            if (!once->cb) return;
            auto fire = std::move(once->cb);
            once->cb = nullptr;
            fire(R(linkgate::common::Error(linkgate::common::ErrorKind::kBackendTimeout, detail)));
        });
    }

    return [loop, once](const R& result) {
        if (!once->cb) return;
        if (once->timer != 0) {
            loop->CancelTimer(once->timer);
            once->timer = 0;
        }
        auto fire = std::move(once->cb);
        once->cb = nullptr;
        fire(result);
    };
}

} // namespace backend
} // namespace linkgate
