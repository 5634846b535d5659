#include "linkgate/gateway/LinkCodec.h"
#include "linkgate/common/Logger.h"

#include <cassert>
#include <map>
#include <string>

using namespace linkgate::gateway;
using namespace linkgate::common;

static const std::map<std::string, std::string> kNoQuery;

void testHashFirst() {
    auto r = DecodeLink("/abc12342", kNoQuery);
    assert(r.ok());
    assert(r.value().objectId == 42);
    assert(r.value().secretHash == "abc123");

    // '_' and '-' belong to the hash charset
    r = DecodeLink("a_-Z9x7", kNoQuery);
    assert(r.ok());
    assert(r.value().secretHash == "a_-Z9x");
    assert(r.value().objectId == 7);

    // cosmetic file name suffix is ignored
    r = DecodeLink("/Xy_-0190001/movie%20file.mkv", kNoQuery);
    assert(r.ok());
    assert(r.value().secretHash == "Xy_-01");
    assert(r.value().objectId == 90001);
    LOG_INFO << "Hash-first links PASS";
}

void testIdFirst() {
    std::map<std::string, std::string> q{{"hash", "  abc123 "}};
    auto r = DecodeLink("/42", q);
    assert(r.ok());
    assert(r.value().objectId == 42);
    assert(r.value().secretHash == "abc123");

    // a short all-digit token is an id, the hash comes from the query
    q = {{"hash", "zz"}};
    r = DecodeLink("/123456", q);
    assert(r.ok());
    assert(r.value().objectId == 123456);
    assert(r.value().secretHash == "zz");

    r = DecodeLink("/42/name.mp4", {{"hash", "qwerty"}});
    assert(r.ok());
    assert(r.value().objectId == 42);
    LOG_INFO << "Id-first links PASS";
}

void testInvalid() {
    assert(!DecodeLink("/", kNoQuery).ok());
    assert(!DecodeLink("", kNoQuery).ok());
    assert(!DecodeLink("/42", kNoQuery).ok());                        // no hash parameter
    assert(!DecodeLink("/42", {{"hash", "   "}}).ok());                // blank hash
    assert(!DecodeLink("/42", {{"hash", "ab$12"}}).ok());              // bad charset
    assert(!DecodeLink("/abc12", kNoQuery).ok());                     // too short, not digits
    assert(!DecodeLink("/abc123", kNoQuery).ok());                    // hash without id
    assert(!DecodeLink("/abc123x5", kNoQuery).ok());                  // id not digits
    assert(!DecodeLink("/ab.12342", kNoQuery).ok());                  // '.' not in charset
    assert(!DecodeLink("/abc12399999999999999999999", kNoQuery).ok()); // id overflows

    auto r = DecodeLink("/nope", kNoQuery);
    assert(!r.ok());
    assert(r.error().kind == ErrorKind::kInvalidLink);
    LOG_INFO << "Invalid links PASS";
}

void testEncode() {
    assert(EncodeLink(42, "abc123") == "abc12342");
    auto r = DecodeLink("/" + EncodeLink(987654321, "Q-_w9z"), kNoQuery);
    assert(r.ok());
    assert(r.value().objectId == 987654321);
    assert(r.value().secretHash == "Q-_w9z");

    assert(IsValidSecretHash("abc_-9"));
    assert(!IsValidSecretHash(""));
    assert(!IsValidSecretHash("a b"));
    LOG_INFO << "Encode links PASS";
}

int main() {
    testHashFirst();
    testIdFirst();
    testInvalid();
    testEncode();
    return 0;
}
