#include "linkgate/balancer/SessionBalancer.h"
#include "linkgate/balancer/SessionRegistry.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/common/Logger.h"
#include "TestSupport.h"

#include <cassert>
#include <vector>

using namespace linkgate::balancer;
using namespace linkgate::common;
using linkgate::network::EventLoop;
using linkgate::test::FakeBackendClient;

void testSelection() {
    SessionBalancer b(8);

    auto r = b.SelectSession({});
    assert(!r.ok());
    assert(r.error().kind == ErrorKind::kNoSessionsAvailable);

    r = b.SelectSession({{0, 3}, {1, 1}, {2, 5}});
    assert(r.ok() && r.value() == 1);

    // ties go to the first listed
    r = b.SelectSession({{4, 2}, {7, 2}, {9, 2}});
    assert(r.ok() && r.value() == 4);

    // at or above the cap only the global minimum is left
    r = b.SelectSession({{0, 9}, {1, 8}, {2, 12}});
    assert(r.ok() && r.value() == 1);

    // a session under the cap wins over one at the cap
    SessionBalancer small(2);
    r = small.SelectSession({{0, 2}, {1, 1}});
    assert(r.ok() && r.value() == 1);

    assert(SessionBalancer(0).softCap() == SessionBalancer::kDefaultSoftCap);
    LOG_INFO << "Session selection PASS";
}

void testSelectionIsMinimum() {
    SessionBalancer b(4);
    for (int a = 0; a < 7; ++a) {
        for (int c = 0; c < 7; ++c) {
            for (int d = 0; d < 7; ++d) {
                std::vector<SessionLoad> loads{{0, a}, {1, c}, {2, d}};
                auto r = b.SelectSession(loads);
                assert(r.ok());
                int chosen = loads[static_cast<size_t>(r.value())].workload;
                for (const auto& l : loads) {
                    assert(chosen <= l.workload);
                }
            }
        }
    }
    LOG_INFO << "Selection picks a minimum PASS";
}

void testRegistry() {
    EventLoop loop;
    SessionRegistry registry(&loop, 8, 1.0);

    auto none = registry.Acquire();
    assert(!none.ok());
    assert(none.error().kind == ErrorKind::kNoSessionsAvailable);
    assert(registry.TotalAcquired() == 0);

    assert(registry.AddSession(std::make_shared<FakeBackendClient>(&loop, 1)));
    assert(registry.AddSession(std::make_shared<FakeBackendClient>(&loop, 2)));
    assert(!registry.AddSession(std::make_shared<FakeBackendClient>(&loop, 2)));
    assert(registry.SessionCount() == 2);

    {
        auto a = registry.Acquire();
        auto b = registry.Acquire();
        assert(a.ok() && b.ok());
        assert(a.value().lease.sessionId() != b.value().lease.sessionId());
        assert(registry.Workload(1) == 1 && registry.Workload(2) == 1);

        // moving transfers the release obligation
        WorkloadLease moved(std::move(a.value().lease));
        assert(!a.value().lease.held());
        assert(moved.held());
        moved.Release();
        moved.Release();
        assert(registry.Workload(moved.sessionId()) == 0);
    }
    assert(registry.Workload(1) == 0 && registry.Workload(2) == 0);
    assert(registry.TotalAcquired() == 2);
    assert(registry.TotalReleased() == 2);
    LOG_INFO << "Session registry PASS";
}

void testStreamerCache() {
    EventLoop loop;
    SessionRegistry registry(&loop, 8, 1.0);
    registry.AddSession(std::make_shared<FakeBackendClient>(&loop, 5));

    auto s1 = registry.GetOrCreateStreamer(5);
    auto s2 = registry.GetOrCreateStreamer(5);
    assert(s1 && s1 == s2);
    assert(!registry.GetOrCreateStreamer(6));

    auto binding = registry.Acquire();
    assert(binding.ok());
    assert(binding.value().streamer == s1);
    assert(registry.StreamersCreated() == 1);
    LOG_INFO << "Streamer cache PASS";
}

int main() {
    testSelection();
    testSelectionIsMinimum();
    testRegistry();
    testStreamerCache();
    return 0;
}
