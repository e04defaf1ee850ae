#pragma once

#include "codetap/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace codetap {
namespace network {

// Owns an OpenSSL client context used for upstream connections.
class TlsContext : codetap::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    // verifyPeer=false skips certificate checks (test upstreams only).
    // caFile empty -> system default verify paths.
    bool InitClient(bool verifyPeer = true, const std::string& caFile = "");

    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    ssl_ctx_st* ctx_{nullptr};
};

} // namespace network
} // namespace codetap
