#pragma once

#include "linkgate/common/Result.h"

#include <vector>

namespace linkgate {
namespace balancer {

struct SessionLoad {
    int sessionId;
    int workload;
};

// Least-workload selection with a soft concurrency cap.
class SessionBalancer {
public:
    static constexpr int kDefaultSoftCap = 8;

    explicit SessionBalancer(int softCap = kDefaultSoftCap)
        : softCap_(softCap > 0 ? softCap : kDefaultSoftCap) {}

    // Minimum workload among sessions below the cap, first found on ties.
    // When every session is at or over the cap, the global minimum.
    linkgate::common::Result<int> SelectSession(const std::vector<SessionLoad>& loads) const;

    int softCap() const { return softCap_; }

private:
    int softCap_;
};

} // namespace balancer
} // namespace linkgate
