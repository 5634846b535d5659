#include "linkgate/gateway/RangeNegotiator.h"

#include <cerrno>
#include <cstdlib>

namespace linkgate {
namespace gateway {

using linkgate::common::Error;
using linkgate::common::ErrorKind;
using linkgate::common::Result;

namespace {

const char kPrefix[] = "bytes=";

// Consumes a run of digits at *pos. False when there is none or it overflows.
bool ConsumeNumber(const std::string& s, size_t* pos, int64_t* out) {
    size_t begin = *pos;
    while (*pos < s.size() && s[*pos] >= '0' && s[*pos] <= '9') {
        ++*pos;
    }
    if (*pos == begin) return false;
    errno = 0;
    long long v = std::strtoll(s.substr(begin, *pos - begin).c_str(), nullptr, 10);
    if (errno == ERANGE) return false;
    *out = static_cast<int64_t>(v);
    return true;
}

} // namespace

Result<ByteRange> NegotiateRange(const std::optional<std::string>& header, int64_t total) {
    if (total <= 0) {
        return Error(ErrorKind::kObjectNotFound, "range requested on an empty object");
    }
    if (!header || header->empty()) {
        return ByteRange{0, total - 1};
    }

    const std::string& h = *header;
    if (h.compare(0, sizeof(kPrefix) - 1, kPrefix) != 0) {
        return Error(ErrorKind::kMalformedRange, "unsupported range unit in '" + h + "'");
    }

    size_t pos = sizeof(kPrefix) - 1;
    ByteRange range;
    if (!ConsumeNumber(h, &pos, &range.start)) {
        return Error(ErrorKind::kMalformedRange, "missing range start in '" + h + "'");
    }
    if (pos >= h.size() || h[pos] != '-') {
        return Error(ErrorKind::kMalformedRange, "missing '-' in '" + h + "'");
    }
    ++pos;

    range.end = total - 1;
    if (pos < h.size() && h[pos] >= '0' && h[pos] <= '9') {
        if (!ConsumeNumber(h, &pos, &range.end)) {
            return Error(ErrorKind::kMalformedRange, "range end out of bounds in '" + h + "'");
        }
    }
    if (pos < h.size() && h[pos] != ',') {
        return Error(ErrorKind::kMalformedRange, "trailing garbage in '" + h + "'");
    }

    if (range.end > total - 1) {
        range.end = total - 1;
    }
    if (range.start > range.end) {
        return Error(ErrorKind::kMalformedRange,
                     "unsatisfiable range '" + h + "' for size " + std::to_string(total));
    }
    return range;
}

} // namespace gateway
} // namespace linkgate
