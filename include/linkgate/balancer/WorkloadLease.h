#pragma once

namespace linkgate {
namespace balancer {

class SessionRegistry;

// One unit of workload on a session. Released exactly once: by Release()
// or by the destructor. Moving transfers the obligation.
class WorkloadLease {
public:
    WorkloadLease() = default;
    WorkloadLease(SessionRegistry* registry, int sessionId)
        : registry_(registry), sessionId_(sessionId) {}
    ~WorkloadLease() { Release(); }

    WorkloadLease(WorkloadLease&& other) noexcept
        : registry_(other.registry_), sessionId_(other.sessionId_) {
        other.registry_ = nullptr;
    }

    WorkloadLease& operator=(WorkloadLease&& other) noexcept {
        if (this != &other) {
            Release();
            registry_ = other.registry_;
            sessionId_ = other.sessionId_;
            other.registry_ = nullptr;
        }
        return *this;
    }

    WorkloadLease(const WorkloadLease&) = delete;
    WorkloadLease& operator=(const WorkloadLease&) = delete;

    void Release();

    bool held() const { return registry_ != nullptr; }
    int sessionId() const { return sessionId_; }

private:
    SessionRegistry* registry_{nullptr};
    int sessionId_{-1};
};

} // namespace balancer
} // namespace linkgate
