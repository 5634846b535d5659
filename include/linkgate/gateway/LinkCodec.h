#pragma once

#include "linkgate/common/Result.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace linkgate {
namespace gateway {

constexpr size_t kSecretHashLength = 6;

// A decoded link: which backend object, and the secret proving possession.
struct LinkRef {
    int64_t objectId{0};
    std::string secretHash;
};

// Accepts "<hash><id>[/...]" or "<id>[/...]" with the hash in the "hash"
// query parameter. The path is percent-decoded and stripped of '/' first.
linkgate::common::Result<LinkRef> DecodeLink(const std::string& path,
                                             const std::map<std::string, std::string>& query);

// Hash-first token for (objectId, hash).
std::string EncodeLink(int64_t objectId, const std::string& secretHash);

bool IsValidSecretHash(const std::string& hash);

} // namespace gateway
} // namespace linkgate
