#include "codetap/audit/ConsoleRenderer.h"
#include "codetap/common/Logger.h"

#include <cassert>
#include <sstream>
#include <string>

using namespace codetap::audit;
using namespace codetap::common;

static Entry makeEntry(int status) {
    Entry e;
    e.method = "POST";
    e.path = "/v3/users/event-log";
    e.requestHeaders = {{"host", "localhost"}, {"user-agent", "CodeTime Client"}};
    e.requestBody = "{\"eventTime\":1}";
    e.responseStatus = status;
    e.responseBody = "{}";
    e.durationMs = 12.5;
    e.rowHash = "abc";
    return e;
}

void testPlainRendering() {
    std::ostringstream out;
    ConsoleRenderer renderer(out, false);
    renderer.Render(makeEntry(200), "a=1", "{\"ok\":true}");

    const std::string expected =
        ">> POST /v3/users/event-log?a=1\n"
        "   Req headers: host: localhost, user-agent: CodeTime Client\n"
        "   Req body: {\"eventTime\":1}\n"
        "<< 200 (12.50ms)\n"
        "   Resp body: {\"ok\":true}\n";
    assert(out.str() == expected);
    LOG_INFO << "Plain rendering PASS";
}

void testOptionalLines() {
    std::ostringstream out;
    ConsoleRenderer renderer(out, false);
    Entry e = makeEntry(204);
    e.requestBody.clear();
    renderer.Render(e, "", "");

    const std::string text = out.str();
    assert(text.find(">> POST /v3/users/event-log\n") == 0);
    assert(text.find("Req body") == std::string::npos);
    assert(text.find("Resp body") == std::string::npos);
    assert(text.find("<< 204 (12.50ms)\n") != std::string::npos);
    LOG_INFO << "Optional lines PASS";
}

void testColors() {
    std::ostringstream out;
    ConsoleRenderer renderer(out, true);
    renderer.Render(makeEntry(503), "", "down");
    const std::string text = out.str();
    assert(text.find("\033[36m>> POST") != std::string::npos);
    assert(text.find("\033[35m   Req headers:") != std::string::npos);
    assert(text.find("\033[94m   Req body:") != std::string::npos);
    assert(text.find("\033[31m<< 503") != std::string::npos);
    assert(text.find("\033[92m   Resp body: down") != std::string::npos);
    assert(text.find("\033[0m") != std::string::npos);

    assert(std::string(ConsoleRenderer::StatusColor(200)) == "\033[32m");
    assert(std::string(ConsoleRenderer::StatusColor(302)) == "\033[32m");
    assert(std::string(ConsoleRenderer::StatusColor(404)) == "\033[33m");
    assert(std::string(ConsoleRenderer::StatusColor(504)) == "\033[31m");
    LOG_INFO << "Colors PASS";
}

void testPreview() {
    const std::string shortText(400, 'a');
    assert(ConsoleRenderer::Preview(shortText) == shortText);

    const std::string longText(450, 'b');
    assert(ConsoleRenderer::Preview(longText) == std::string(400, 'b') + "...(truncated 50 chars)");

    std::string accents;
    for (int i = 0; i < 401; ++i) accents += "\xc3\xa9";
    const std::string p = ConsoleRenderer::Preview(accents);
    assert(p == accents.substr(0, 800) + "...(truncated 1 chars)");
    LOG_INFO << "Preview PASS";
}

void testBrokenStreamIsSwallowedWithWarning() {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    ConsoleRenderer renderer(out, false);
    renderer.Render(makeEntry(200), "", "{}");
    // the renderer clears the error so later entries can still print
    assert(out.good());
    LOG_INFO << "Broken stream PASS";
}

int main() {
    testPlainRendering();
    testOptionalLines();
    testColors();
    testPreview();
    testBrokenStreamIsSwallowedWithWarning();
    return 0;
}
