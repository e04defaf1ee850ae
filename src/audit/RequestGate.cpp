#include "codetap/audit/RequestGate.h"

namespace codetap {
namespace audit {

const char RequestGate::kClientMarker[] = "CodeTime Client";
const char RequestGate::kDenyBody[] = "Unsupported client";

RequestGate::Decision RequestGate::Admit(const StringMap& headers) {
    auto it = headers.find("user-agent");
    if (it == headers.end()) return kDeny;
    return it->second.find(kClientMarker) != std::string::npos ? kAllow : kDeny;
}

} // namespace audit
} // namespace codetap
