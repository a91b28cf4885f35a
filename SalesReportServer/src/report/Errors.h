#pragma once

#include <boost/system/error_code.hpp>
#include <type_traits>

namespace report {

enum class errc {
    ok = 0,
    invalid_date_format,
    incomplete_range,
    invalid_range,
    store_unavailable,
    query_failed,
    cache_unavailable
};

const boost::system::error_category& report_category();

boost::system::error_code make_error_code(errc e);

// 4xx-equivalent input errors
bool is_client_error(const boost::system::error_code& ec);

}

namespace boost { namespace system {
template <> struct is_error_code_enum<report::errc> : std::true_type {};
} }
