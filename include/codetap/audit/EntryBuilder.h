#pragma once

#include "codetap/audit/Entry.h"
#include "codetap/audit/Forwarder.h"

#include <string>

namespace codetap {
namespace protocol {
class HttpRequest;
}

namespace audit {

// Assembles the immutable Entry for one exchange and its row_hash.
class EntryBuilder {
public:
    static EntryPtr Build(const codetap::protocol::HttpRequest& req,
                          const Forwarder::Outcome& outcome,
                          const RequestMetadata& metadata,
                          const std::string& sanitizedBody);

    // Lower-case hex SHA-256 over the compact sorted-key JSON of
    // {method, path, query, request_body, response_status}.
    static std::string RowHash(const std::string& method,
                               const std::string& path,
                               const StringMap& query,
                               const std::string& requestBody,
                               int responseStatus);

    // "a=1&b=2&a=3" -> {a: 3, b: 2}; names and values are percent-decoded
    // and '+' reads as a space.
    static StringMap ParseQuery(const std::string& rawQuery);
    static std::string PercentDecode(const std::string& s, bool plusAsSpace);

    // Drops invalid UTF-8 sequences and NUL bytes.
    static std::string CleanUtf8(const std::string& raw);
};

} // namespace audit
} // namespace codetap
