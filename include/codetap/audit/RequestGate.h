#pragma once

#include "codetap/audit/Entry.h"

#include <string>

namespace codetap {
namespace audit {

// Admits only requests whose User-Agent carries the CodeTime client marker.
class RequestGate {
public:
    static const char kClientMarker[];
    static const char kDenyBody[];

    enum Decision { kAllow, kDeny };

    // headers: lower-cased names
    static Decision Admit(const StringMap& headers);
};

} // namespace audit
} // namespace codetap
