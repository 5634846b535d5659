#include "linkgate/common/Random.h"
#include "linkgate/common/Logger.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <vector>

namespace linkgate {
namespace common {

std::string RandomHex(size_t nbytes) {
    static const char kHex[] = "0123456789abcdef";
    std::vector<unsigned char> raw(nbytes);
    if (nbytes > 0 && RAND_bytes(raw.data(), static_cast<int>(nbytes)) != 1) {
        char buf[256];
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        LOG_ERROR << "RAND_bytes failed: " << buf;
        return std::string();
    }
    std::string out;
    out.reserve(nbytes * 2);
    for (unsigned char b : raw) {
        out.push_back(kHex[b >> 4]);
        out.push_back(kHex[b & 0x0f]);
    }
    return out;
}

} // namespace common
} // namespace linkgate
