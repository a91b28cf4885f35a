#include "CacheKeys.h"

namespace cache {

std::string cache_key_for_window(const std::string& prefix, const report::TimestampWindow& window) {
    return prefix + ":" + report::format_seconds(window.start) + ":" + report::format_seconds(window.end);
}

std::string cache_key_namespace(const std::string& parent, const std::string& child) {
    return parent + ":" + child;
}

}
