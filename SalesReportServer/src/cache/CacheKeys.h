#pragma once
#include "report/DateRange.h"
#include <string>

namespace cache {

// prefix:YYYY-MM-DD HH:MM:SS:YYYY-MM-DD HH:MM:SS
// Depends only on the two boundary instants (to the second), never on how the
// window was requested.
std::string cache_key_for_window(const std::string& prefix, const report::TimestampWindow& window);

// namespace nested under a parent prefix, e.g. "vendas_realtime" + "pacotes"
std::string cache_key_namespace(const std::string& parent, const std::string& child);

}
