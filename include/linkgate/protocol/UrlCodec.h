#pragma once

#include <map>
#include <string>

namespace linkgate {
namespace protocol {

class UrlCodec {
public:
    // Invalid escapes are kept literally. With plusAsSpace, '+' decodes to ' '.
    static std::string PercentDecode(const std::string& in, bool plusAsSpace = false);

    // application/x-www-form-urlencoded. The first occurrence of a key wins.
    static std::map<std::string, std::string> ParseQuery(const std::string& query);

    // Escapes everything except unreserved characters and '/'.
    static std::string PercentEncode(const std::string& in);

    // RFC 5987 ext-value: UTF-8''<percent-encoded>.
    static std::string EncodeExtValue(const std::string& in);
};

} // namespace protocol
} // namespace linkgate
