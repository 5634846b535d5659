#include "linkgate/network/Poller.h"
#include "linkgate/network/Channel.h"
#include "linkgate/network/EpollPoller.h"

namespace linkgate {
namespace network {

Poller::Poller(EventLoop* loop) : loop_(loop) {}

Poller::~Poller() = default;

bool Poller::HasChannel(Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

Poller* Poller::NewDefaultPoller(EventLoop* loop) {
    return new EpollPoller(loop);
}

} // namespace network
} // namespace linkgate
