#include "linkgate/balancer/SessionBalancer.h"

namespace linkgate {
namespace balancer {

using linkgate::common::Error;
using linkgate::common::ErrorKind;
using linkgate::common::Result;

Result<int> SessionBalancer::SelectSession(const std::vector<SessionLoad>& loads) const {
    if (loads.empty()) {
        return Error(ErrorKind::kNoSessionsAvailable, "no backend sessions registered");
    }

    const SessionLoad* bestUnderCap = nullptr;
    const SessionLoad* bestOverall = nullptr;
    for (const auto& load : loads) {
        if (!bestOverall || load.workload < bestOverall->workload) {
            bestOverall = &load;
        }
        if (load.workload < softCap_ && (!bestUnderCap || load.workload < bestUnderCap->workload)) {
            bestUnderCap = &load;
        }
    }
    return bestUnderCap ? bestUnderCap->sessionId : bestOverall->sessionId;
}

} // namespace balancer
} // namespace linkgate
