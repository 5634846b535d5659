#pragma once

#include "linkgate/common/Result.h"

#include <cstdint>
#include <optional>
#include <string>

namespace linkgate {
namespace gateway {

// Inclusive byte window, 0 <= start <= end <= total - 1.
struct ByteRange {
    int64_t start{0};
    int64_t end{0};

    int64_t length() const { return end - start + 1; }
};

// Grammar: "bytes=<start>-[<end>]", a second range after ',' is ignored.
// The start is mandatory; a missing end means the last byte; the end is
// clamped to total - 1. start > end after clamping is kMalformedRange.
linkgate::common::Result<ByteRange> NegotiateRange(const std::optional<std::string>& header, int64_t total);

} // namespace gateway
} // namespace linkgate
