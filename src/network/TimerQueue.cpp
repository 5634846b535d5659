#include "linkgate/network/TimerQueue.h"
#include "linkgate/network/EventLoop.h"
#include "linkgate/common/Logger.h"

#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace linkgate {
namespace network {

namespace {

int CreateTimerfd() {
    int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        LOG_FATAL << "timerfd_create failed: " << std::strerror(errno);
    }
    return fd;
}

} // namespace

TimerQueue::TimerQueue(EventLoop* loop)
    : loop_(loop),
      timerfd_(CreateTimerfd()),
      timerfd_channel_(loop, timerfd_),
      next_id_(1) {
    timerfd_channel_.SetReadCallback(
        [this](std::chrono::system_clock::time_point) { HandleRead(); });
    timerfd_channel_.EnableReading();
}

TimerQueue::~TimerQueue() {
    timerfd_channel_.DisableAll();
    timerfd_channel_.Remove();
    ::close(timerfd_);
}

TimerId TimerQueue::Add(Clock::time_point when, TimerCallback cb) {
    TimerId id = next_id_++;
    bool earliest = timers_.empty() || when < timers_.begin()->first.first;
    timers_.emplace(Key(when, id), std::move(cb));
    index_[id] = when;
    if (earliest) {
        ResetTimerfd();
    }
    return id;
}

void TimerQueue::Cancel(TimerId id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return;
    }
    timers_.erase(Key(it->second, id));
    index_.erase(it);
}

void TimerQueue::HandleRead() {
    uint64_t expirations = 0;
    ssize_t n = ::read(timerfd_, &expirations, sizeof expirations);
    if (n != sizeof expirations && errno != EAGAIN) {
        LOG_ERROR << "TimerQueue::HandleRead() reads " << n << " bytes instead of 8";
    }

    auto now = Clock::now();
    std::vector<TimerCallback> expired;
    while (!timers_.empty() && timers_.begin()->first.first <= now) {
        auto it = timers_.begin();
        index_.erase(it->first.second);
        expired.push_back(std::move(it->second));
        timers_.erase(it);
    }

    // Callbacks may add or cancel timers.
    for (auto& cb : expired) {
        cb();
    }
    ResetTimerfd();
}

void TimerQueue::ResetTimerfd() {
    struct itimerspec spec;
    std::memset(&spec, 0, sizeof spec);
    if (!timers_.empty()) {
        auto delta = timers_.begin()->first.first - Clock::now();
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(delta).count();
        if (ns < 100000) {
            ns = 100000;
        }
        spec.it_value.tv_sec = static_cast<time_t>(ns / 1000000000);
        spec.it_value.tv_nsec = static_cast<long>(ns % 1000000000);
    }
    if (::timerfd_settime(timerfd_, 0, &spec, nullptr) < 0) {
        LOG_ERROR << "timerfd_settime failed: " << std::strerror(errno);
    }
}

} // namespace network
} // namespace linkgate
