#pragma once

#include <string>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };
    Type type = Type::Null;
    bool boolean = false;
    double number = 0.0;
    std::string str;
    std::vector<JsonValue> arr;
    std::vector<std::pair<std::string, JsonValue>> obj;

    bool is_null() const { return type == Type::Null; }
    // nullptr when absent or when this is not an object
    const JsonValue* find(const std::string& key) const;
};

// Throws std::runtime_error on malformed input or trailing garbage.
JsonValue json_parse(std::string_view js);

std::string json_escape_resp(const std::string& s);
// shortest of %.15g / %.17g that reads back to the same double
std::string json_emit_number(double v);
std::string json_emit_string_or_null(const std::optional<std::string>& o);
