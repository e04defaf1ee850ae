#pragma once

#include "codetap/audit/EntrySink.h"

#include <vector>

namespace codetap {
namespace audit {

// Hands each Entry to every registered sink. Sinks queue their own I/O, so
// the writes overlap; one sink throwing never keeps the others from running.
class PersistenceFanout {
public:
    // Sinks are borrowed and must outlive the fanout.
    void AddSink(EntrySink* sink) { sinks_.push_back(sink); }
    size_t sinkCount() const { return sinks_.size(); }

    void Persist(const EntryPtr& entry);

private:
    std::vector<EntrySink*> sinks_;
};

} // namespace audit
} // namespace codetap
