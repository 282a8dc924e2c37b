#include "wccforest/storage/graph_store.h"
#include <sstream>

namespace wccforest {
namespace storage {

std::string GraphStoreStats::to_string() const {
    std::ostringstream oss;
    oss << "events=" << events
        << " entities=" << entities
        << " touch_edges=" << touch_edges
        << " precedence_edges=" << precedence_edges
        << " forest_edges=" << forest_edges
        << " processed=" << processed_events
        << " with_metrics=" << events_with_metrics;
    return oss.str();
}

} // namespace storage
} // namespace wccforest
