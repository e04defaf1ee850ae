#include "codetap/audit/RequestGate.h"
#include "codetap/common/Logger.h"

#include <cassert>

using namespace codetap::audit;
using namespace codetap::common;

void testAdmitsCodeTimeClient() {
    StringMap headers{{"user-agent", "CodeTime Client/1.4 (vscode)"}};
    assert(RequestGate::Admit(headers) == RequestGate::kAllow);

    headers["user-agent"] = "Mozilla/5.0 CodeTime Client";
    assert(RequestGate::Admit(headers) == RequestGate::kAllow);
    LOG_INFO << "Admit CodeTime Client PASS";
}

void testRejectsOthers() {
    assert(RequestGate::Admit(StringMap{}) == RequestGate::kDeny);
    assert(RequestGate::Admit(StringMap{{"user-agent", "curl/8.1"}}) == RequestGate::kDeny);
    assert(RequestGate::Admit(StringMap{{"user-agent", ""}}) == RequestGate::kDeny);
    // case-sensitive marker
    assert(RequestGate::Admit(StringMap{{"user-agent", "codetime client"}}) == RequestGate::kDeny);
    // only the user agent counts
    assert(RequestGate::Admit(StringMap{{"x-client", "CodeTime Client"}}) == RequestGate::kDeny);
    LOG_INFO << "Reject other clients PASS";
}

int main() {
    testAdmitsCodeTimeClient();
    testRejectsOthers();
    return 0;
}
