#pragma once

#include "linkgate/backend/BackendClient.h"
#include "linkgate/backend/ByteStreamer.h"
#include "linkgate/balancer/SessionBalancer.h"
#include "linkgate/balancer/WorkloadLease.h"
#include "linkgate/common/noncopyable.h"
#include "linkgate/common/Result.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace linkgate {
namespace network {
class EventLoop;
}

namespace balancer {

// Owns the backend sessions, their workload counters and the per-session
// streamer cache. Created once at startup and passed by reference.
class SessionRegistry : linkgate::common::noncopyable {
public:
    struct Binding {
        WorkloadLease lease;
        backend::ByteStreamerPtr streamer;
    };

    SessionRegistry(linkgate::network::EventLoop* loop, int softCap, double backendTimeoutSec);

    // Ids must be unique; a duplicate is rejected.
    bool AddSession(backend::BackendClientPtr client);

    size_t SessionCount() const;
    int Workload(int sessionId) const;
    std::map<int, int> Workloads() const;

    // Selects a session and takes one unit of its workload in one step.
    linkgate::common::Result<Binding> Acquire();

    // Idempotent: the first call for a session creates its streamer, later
    // calls return the same one. Null for an unknown session.
    backend::ByteStreamerPtr GetOrCreateStreamer(int sessionId);

    uint64_t TotalAcquired() const;
    uint64_t TotalReleased() const;
    size_t StreamersCreated() const;

    const SessionBalancer& balancer() const { return balancer_; }

private:
    friend class WorkloadLease;

    struct Session {
        backend::BackendClientPtr client;
        backend::ByteStreamerPtr streamer;
        int workload{0};
    };

    void ReleaseOne(int sessionId);
    backend::ByteStreamerPtr GetOrCreateStreamerLocked(int sessionId);

    linkgate::network::EventLoop* loop_;
    SessionBalancer balancer_;
    double backendTimeoutSec_;

    mutable std::mutex mutex_;
    std::map<int, Session> sessions_;
    uint64_t acquired_{0};
    uint64_t released_{0};
    size_t streamersCreated_{0};
};

} // namespace balancer
} // namespace linkgate
