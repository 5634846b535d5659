#pragma once

#include <memory>
#include <functional>
#include <chrono>
#include <cstdint>

namespace linkgate {
namespace network {

class TcpConnection;
class Buffer;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;
using WriteCompleteCallback = std::function<void(const TcpConnectionPtr&)>;

using MessageCallback = std::function<void(const TcpConnectionPtr&,
                                           Buffer*,
                                           std::chrono::system_clock::time_point)>;

using TimerCallback = std::function<void()>;
// 0 is never a valid timer id.
using TimerId = std::uint64_t;

} // namespace network
} // namespace linkgate
