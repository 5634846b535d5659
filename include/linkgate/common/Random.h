#pragma once

#include <cstddef>
#include <string>

namespace linkgate {
namespace common {

// Lowercase hex of nbytes bytes from the OpenSSL CSPRNG (2*nbytes chars).
// Returns an empty string if the generator fails.
std::string RandomHex(size_t nbytes);

} // namespace common
} // namespace linkgate
