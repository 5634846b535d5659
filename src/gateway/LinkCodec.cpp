#include "linkgate/gateway/LinkCodec.h"
#include "linkgate/protocol/UrlCodec.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace linkgate {
namespace gateway {

using linkgate::common::Error;
using linkgate::common::ErrorKind;
using linkgate::common::Result;

namespace {

bool IsHashChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool AllDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool ParseObjectId(const std::string& digits, int64_t* out) {
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(digits.c_str(), &end, 10);
    if (errno == ERANGE || end == digits.c_str() || *end != '\0') {
        return false;
    }
    *out = static_cast<int64_t>(v);
    return true;
}

std::string StripSlashes(const std::string& s) {
    size_t b = s.find_first_not_of('/');
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of('/');
    return s.substr(b, e - b + 1);
}

std::string StripWhitespace(const std::string& s) {
    const char* ws = " \t\r\n\v\f";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

} // namespace

bool IsValidSecretHash(const std::string& hash) {
    if (hash.empty()) return false;
    for (char c : hash) {
        if (!IsHashChar(c)) return false;
    }
    return true;
}

Result<LinkRef> DecodeLink(const std::string& path, const std::map<std::string, std::string>& query) {
    const std::string clean = StripSlashes(linkgate::protocol::UrlCodec::PercentDecode(path));
    // Anything after the first '/' is a cosmetic suffix (usually a file name).
    const std::string token = clean.substr(0, clean.find('/'));

    LinkRef ref;
    if (token.size() > kSecretHashLength) {
        const std::string hash = token.substr(0, kSecretHashLength);
        const std::string digits = token.substr(kSecretHashLength);
        if (IsValidSecretHash(hash) && AllDigits(digits)) {
            if (!ParseObjectId(digits, &ref.objectId)) {
                return Error(ErrorKind::kInvalidLink, "object id out of range: " + digits);
            }
            ref.secretHash = hash;
            return ref;
        }
    }

    if (AllDigits(token)) {
        if (!ParseObjectId(token, &ref.objectId)) {
            return Error(ErrorKind::kInvalidLink, "object id out of range: " + token);
        }
        auto it = query.find("hash");
        ref.secretHash = StripWhitespace(it == query.end() ? std::string() : it->second);
        if (!IsValidSecretHash(ref.secretHash)) {
            return Error(ErrorKind::kInvalidLink, "missing or malformed hash parameter");
        }
        return ref;
    }

    return Error(ErrorKind::kInvalidLink, "unrecognized link '" + clean + "'");
}

std::string EncodeLink(int64_t objectId, const std::string& secretHash) {
    return secretHash + std::to_string(objectId);
}

} // namespace gateway
} // namespace linkgate
