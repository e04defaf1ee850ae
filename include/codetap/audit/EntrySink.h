#pragma once

#include "codetap/audit/Entry.h"
#include "codetap/common/noncopyable.h"

namespace codetap {
namespace audit {

// Persistence backend. Submit never blocks on I/O and never throws; a sink
// reports its own failures through the logger.
class EntrySink : codetap::common::noncopyable {
public:
    virtual ~EntrySink() = default;

    virtual const char* name() const = 0;
    virtual void Submit(const EntryPtr& entry) = 0;
};

} // namespace audit
} // namespace codetap
