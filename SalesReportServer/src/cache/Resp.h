#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <optional>

namespace cache {

enum class RespType { SimpleString, Error, Integer, BulkString, Array, Null };

struct RespValue {
    RespType type = RespType::Null;
    std::string str; 
    int64_t integer = 0; 
    std::vector<RespValue> arr; 
};


std::string resp_encode(const std::vector<std::string>& args);

// Parses one reply from the front of buf. nullopt when buf holds an incomplete
// reply; throws std::runtime_error on a malformed one. consumed is set on success.
std::optional<RespValue> resp_parse_prefix(std::string_view buf, std::size_t& consumed);

// Whole-buffer variant; nullopt on incomplete or malformed input.
std::optional<RespValue> resp_parse(const std::string& buf);

} 
