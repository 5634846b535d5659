#pragma once

#include "linkgate/common/noncopyable.h"
#include <vector>
#include <unordered_map>
#include <chrono>

namespace linkgate {
namespace network {

class Channel;
class EventLoop;

// I/O multiplexing seam. Always used from the owning loop's thread.
class Poller : linkgate::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    explicit Poller(EventLoop* loop);
    virtual ~Poller();

    virtual std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels) = 0;
    virtual void UpdateChannel(Channel* channel) = 0;
    virtual void RemoveChannel(Channel* channel) = 0;
    virtual bool HasChannel(Channel* channel) const;

    static Poller* NewDefaultPoller(EventLoop* loop);

protected:
    using ChannelMap = std::unordered_map<int, Channel*>;
    ChannelMap channels_;

    EventLoop* ownerLoop() const { return loop_; }

private:
    EventLoop* loop_;
};

} // namespace network
} // namespace linkgate
