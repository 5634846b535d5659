#include "linkgate/protocol/Compression.h"

#include <zlib.h>

#include <cctype>
#include <cstdlib>
#include <cstring>

namespace linkgate {
namespace protocol {

static std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

static std::string TrimCopy(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

Compression::Encoding Compression::NegotiateAcceptEncoding(const std::string& acceptEncoding) {
    bool gzip = false;
    bool deflate = false;
    const std::string lv = ToLowerCopy(acceptEncoding);
    size_t pos = 0;
    while (pos < lv.size()) {
        size_t comma = lv.find(',', pos);
        if (comma == std::string::npos) comma = lv.size();
        std::string item = lv.substr(pos, comma - pos);
        pos = comma + 1;

        double q = 1.0;
        size_t semi = item.find(';');
        if (semi != std::string::npos) {
            std::string param = TrimCopy(item.substr(semi + 1));
            if (param.compare(0, 2, "q=") == 0) {
                q = std::strtod(param.c_str() + 2, nullptr);
            }
            item.resize(semi);
        }
        item = TrimCopy(item);
        if (q <= 0.0) continue;
        if (item == "gzip" || item == "x-gzip" || item == "*") gzip = true;
        else if (item == "deflate") deflate = true;
    }
    if (gzip) return Encoding::kGzip;
    if (deflate) return Encoding::kDeflate;
    return Encoding::kIdentity;
}

const char* Compression::EncodingName(Encoding enc) {
    switch (enc) {
        case Encoding::kGzip: return "gzip";
        case Encoding::kDeflate: return "deflate";
        case Encoding::kIdentity: return "identity";
    }
    return "identity";
}

static bool DeflateAll(const uint8_t* data, size_t len, int windowBits, std::string* out) {
    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    zs.avail_in = static_cast<uInt>(len);
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) return false;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = deflate(&zs, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, buf + produced);
    }
    deflateEnd(&zs);
    return true;
}

bool Compression::Compress(Encoding enc, const uint8_t* data, size_t len, std::string* out) {
    if (!out) return false;
    switch (enc) {
        case Encoding::kIdentity:
            out->assign(reinterpret_cast<const char*>(data), len);
            return true;
        case Encoding::kGzip:
            return DeflateAll(data, len, 16 + MAX_WBITS, out);
        case Encoding::kDeflate:
            return DeflateAll(data, len, MAX_WBITS, out);
    }
    return false;
}

bool Compression::Compress(Encoding enc, const std::string& in, std::string* out) {
    return Compress(enc, reinterpret_cast<const uint8_t*>(in.data()), in.size(), out);
}

} // namespace protocol
} // namespace linkgate
