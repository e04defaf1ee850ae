#include "codetap/audit/ResponseSanitizer.h"
#include "codetap/common/Logger.h"

#include <cassert>
#include <string>

using namespace codetap::audit;
using namespace codetap::common;

void testStripsUnsafeBytes() {
    const std::string raw("{\"x\": 1}\x00\x01", 10);
    assert(ResponseSanitizer::Sanitize(raw) == "{\"x\": 1}");

    const std::string mixed = "a\tb\nc\rd\x7f" "e\x1b[0m\xc3\xa9";
    assert(ResponseSanitizer::Sanitize(mixed) == "a\tb\nc\rde[0m");
    LOG_INFO << "Strip unsafe bytes PASS";
}

void testEmptyBecomesObject() {
    assert(ResponseSanitizer::Sanitize("") == "{}");
    assert(ResponseSanitizer::Sanitize(std::string("\x00\x02\xff", 3)) == "{}");
    LOG_INFO << "Empty body PASS";
}

void testNonJsonTextIsKept() {
    assert(ResponseSanitizer::Sanitize("<html>oops</html>") == "<html>oops</html>");
    assert(ResponseSanitizer::Sanitize("{\"a\":[1,2]}") == "{\"a\":[1,2]}");
    LOG_INFO << "Keep non-JSON text PASS";
}

int main() {
    testStripsUnsafeBytes();
    testEmptyBecomesObject();
    testNonJsonTextIsKept();
    return 0;
}
