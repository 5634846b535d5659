#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace linkgate {
namespace protocol {

// Whole-buffer zlib codecs for small text responses.
class Compression {
public:
    enum class Encoding {
        kIdentity,
        kGzip,
        kDeflate,
    };

    // Best encoding the client accepts; gzip is preferred. q=0 entries are refused.
    static Encoding NegotiateAcceptEncoding(const std::string& acceptEncoding);
    // Content-Encoding token.
    static const char* EncodingName(Encoding enc);

    static bool Compress(Encoding enc, const uint8_t* data, size_t len, std::string* out);
    static bool Compress(Encoding enc, const std::string& in, std::string* out);
};

} // namespace protocol
} // namespace linkgate
