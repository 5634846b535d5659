#pragma once

#include "linkgate/common/noncopyable.h"
#include "linkgate/network/Callbacks.h"
#include "linkgate/network/Channel.h"

#include <chrono>
#include <map>
#include <unordered_map>
#include <utility>

namespace linkgate {
namespace network {

class EventLoop;

// One-shot timers multiplexed onto a single timerfd. Loop thread only.
class TimerQueue : linkgate::common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;

    explicit TimerQueue(EventLoop* loop);
    ~TimerQueue();

    TimerId Add(Clock::time_point when, TimerCallback cb);
    void Cancel(TimerId id);

    size_t size() const { return timers_.size(); }

private:
    using Key = std::pair<Clock::time_point, TimerId>;

    void HandleRead();
    void ResetTimerfd();

    EventLoop* loop_;
    const int timerfd_;
    Channel timerfd_channel_;
    TimerId next_id_;
    std::map<Key, TimerCallback> timers_;
    std::unordered_map<TimerId, Clock::time_point> index_;
};

} // namespace network
} // namespace linkgate
