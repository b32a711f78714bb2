#include "pan_series/core/errors.hpp"

#include <sstream>

namespace pan_series {

bool RequestContext::empty() const {
    return !bbox && !time_range && collection_id.empty() && !timestamp;
}

std::string RequestContext::describe() const {
    std::ostringstream oss;
    bool first = true;
    auto sep = [&]() {
        if (!first) oss << ", ";
        first = false;
    };
    if (bbox) {
        sep();
        oss << "bbox=" << describe_bbox(*bbox);
    }
    if (time_range) {
        sep();
        oss << "time=" << format_iso8601(time_range->start) << "/" << format_iso8601(time_range->end);
    }
    if (!collection_id.empty()) {
        sep();
        oss << "collection=" << collection_id;
    }
    if (timestamp) {
        sep();
        oss << "timestamp=" << format_iso8601(*timestamp);
    }
    return oss.str();
}

std::string PanSeriesError::with_context(const std::string& message, const RequestContext& context) {
    if (context.empty()) {
        return message;
    }
    return message + " [" + context.describe() + "]";
}

} // namespace pan_series
