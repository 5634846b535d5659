#include "linkgate/common/TimeFormat.h"

#include <sstream>

namespace linkgate {
namespace common {

std::string ReadableDuration(long long seconds) {
    if (seconds < 0) seconds = 0;
    const long long days = seconds / 86400;
    const long long hours = (seconds % 86400) / 3600;
    const long long minutes = (seconds % 3600) / 60;
    const long long secs = seconds % 60;

    std::ostringstream ss;
    bool started = false;
    auto emit = [&](long long v, const char* unit) {
        if (v == 0 && !started) return;
        if (started) ss << ' ';
        ss << v << unit;
        started = true;
    };
    emit(days, "d");
    emit(hours, "h");
    emit(minutes, "m");
    if (started) ss << ' ';
    ss << secs << 's';
    return ss.str();
}

} // namespace common
} // namespace linkgate
