#include "codetap/audit/PersistenceFanout.h"
#include "codetap/common/Logger.h"

#include <exception>

namespace codetap {
namespace audit {

void PersistenceFanout::Persist(const EntryPtr& entry) {
    for (EntrySink* sink : sinks_) {
        try {
            sink->Submit(entry);
        } catch (const std::exception& e) {
            LOG_ERROR << "PersistenceFanout: sink " << sink->name() << " rejected entry "
                      << entry->rowHash << ": " << e.what();
        }
    }
}

} // namespace audit
} // namespace codetap
