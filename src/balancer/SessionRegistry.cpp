#include "linkgate/balancer/SessionRegistry.h"
#include "linkgate/common/Logger.h"

namespace linkgate {
namespace balancer {

using linkgate::common::Error;
using linkgate::common::ErrorKind;
using linkgate::common::Result;

void WorkloadLease::Release() {
    if (registry_) {
        SessionRegistry* registry = registry_;
        registry_ = nullptr;
        registry->ReleaseOne(sessionId_);
    }
}

SessionRegistry::SessionRegistry(linkgate::network::EventLoop* loop, int softCap, double backendTimeoutSec)
    : loop_(loop),
      balancer_(softCap),
      backendTimeoutSec_(backendTimeoutSec) {
}

bool SessionRegistry::AddSession(backend::BackendClientPtr client) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int id = client->id();
    if (sessions_.count(id)) {
        LOG_ERROR << "SessionRegistry: duplicate session id " << id;
        return false;
    }
    sessions_[id].client = std::move(client);
    LOG_INFO << "SessionRegistry: registered session " << id;
    return true;
}

size_t SessionRegistry::SessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

int SessionRegistry::Workload(int sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    return it == sessions_.end() ? 0 : it->second.workload;
}

std::map<int, int> SessionRegistry::Workloads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<int, int> out;
    for (const auto& item : sessions_) {
        out[item.first] = item.second.workload;
    }
    return out;
}

Result<SessionRegistry::Binding> SessionRegistry::Acquire() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SessionLoad> loads;
    loads.reserve(sessions_.size());
    for (const auto& item : sessions_) {
        loads.push_back(SessionLoad{item.first, item.second.workload});
    }

    Result<int> chosen = balancer_.SelectSession(loads);
    if (!chosen.ok()) {
        return chosen.error();
    }

    const int id = chosen.value();
    Session& session = sessions_[id];
    session.workload += 1;
    acquired_ += 1;
    LOG_DEBUG << "SessionRegistry: session " << id << " workload -> " << session.workload;

    Binding binding;
    binding.streamer = GetOrCreateStreamerLocked(id);
    binding.lease = WorkloadLease(this, id);
    return Binding(std::move(binding));
}

backend::ByteStreamerPtr SessionRegistry::GetOrCreateStreamer(int sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetOrCreateStreamerLocked(sessionId);
}

backend::ByteStreamerPtr SessionRegistry::GetOrCreateStreamerLocked(int sessionId) {
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return backend::ByteStreamerPtr();
    }
    Session& session = it->second;
    if (!session.streamer) {
        session.streamer = std::make_shared<backend::ByteStreamer>(loop_, session.client, backendTimeoutSec_);
        streamersCreated_ += 1;
        LOG_DEBUG << "SessionRegistry: created streamer for session " << sessionId;
    }
    return session.streamer;
}

void SessionRegistry::ReleaseOne(int sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        LOG_ERROR << "SessionRegistry: release for unknown session " << sessionId;
        return;
    }
    if (it->second.workload <= 0) {
        LOG_ERROR << "SessionRegistry: workload underflow on session " << sessionId;
        return;
    }
    it->second.workload -= 1;
    released_ += 1;
    LOG_DEBUG << "SessionRegistry: session " << sessionId << " workload -> " << it->second.workload;
}

uint64_t SessionRegistry::TotalAcquired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acquired_;
}

uint64_t SessionRegistry::TotalReleased() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_;
}

size_t SessionRegistry::StreamersCreated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streamersCreated_;
}

} // namespace balancer
} // namespace linkgate
