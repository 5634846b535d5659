#include "linkgate/protocol/UrlCodec.h"
#include "linkgate/common/Logger.h"
#include <cassert>
#include <string>

using namespace linkgate::protocol;
using namespace linkgate::common;

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);

    assert(UrlCodec::PercentDecode("a%20b") == "a b");
    assert(UrlCodec::PercentDecode("%2Fx%2f") == "/x/");
    assert(UrlCodec::PercentDecode("a+b") == "a+b");
    assert(UrlCodec::PercentDecode("a+b", true) == "a b");
    // invalid or cut-off escapes stay literal
    assert(UrlCodec::PercentDecode("100%") == "100%");
    assert(UrlCodec::PercentDecode("%zz%4") == "%zz%4");
    LOG_INFO << "Percent decode PASS";

    auto q = UrlCodec::ParseQuery("hash=ab%2Bc&x=1&hash=second&flag&&sp=a+b");
    assert(q["hash"] == "ab+c");
    assert(q["x"] == "1");
    assert(q.count("flag") == 1 && q["flag"].empty());
    assert(q["sp"] == "a b");
    assert(UrlCodec::ParseQuery("").empty());
    LOG_INFO << "Parse query PASS";

    assert(UrlCodec::PercentEncode("clip one.mp4") == "clip%20one.mp4");
    assert(UrlCodec::PercentEncode("a/b~c_d-e") == "a/b~c_d-e");
    assert(UrlCodec::PercentEncode("\xc3\xa9t\xc3\xa9") == "%C3%A9t%C3%A9");
    assert(UrlCodec::EncodeExtValue("r\xc3\xa9sum\xc3\xa9 (1).pdf") == "UTF-8''r%C3%A9sum%C3%A9%20%281%29.pdf");
    LOG_INFO << "Percent encode PASS";
    return 0;
}
