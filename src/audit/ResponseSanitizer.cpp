#include "codetap/audit/ResponseSanitizer.h"
#include "codetap/common/Logger.h"

#include <nlohmann/json.hpp>

namespace codetap {
namespace audit {

const char ResponseSanitizer::kEmptyBody[] = "{}";

std::string ResponseSanitizer::Sanitize(const std::string& text) {
    if (text.empty()) return kEmptyBody;

    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (IsSafeByte(static_cast<unsigned char>(c))) out.push_back(c);
    }
    if (out.empty()) return kEmptyBody;

    if (!nlohmann::json::accept(out)) {
        LOG_DEBUG << "ResponseSanitizer: body is not JSON, keeping " << out.size() << " bytes as text";
    }
    return out;
}

} // namespace audit
} // namespace codetap
