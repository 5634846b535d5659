#pragma once

#include <string>

namespace linkgate {
namespace common {

// 93784 -> "1d 2h 3m 4s". Leading zero units are dropped; never empty.
std::string ReadableDuration(long long seconds);

} // namespace common
} // namespace linkgate
