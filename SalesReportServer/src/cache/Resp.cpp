#include "Resp.h"
#include <stdexcept>

namespace cache {

static constexpr int64_t MAX_BULK = 64 * 1024 * 1024;
static constexpr int64_t MAX_ARRAY = 1024 * 1024;

std::string resp_encode(const std::vector<std::string>& args) {
    std::string out;
    out += "*" + std::to_string(args.size()) + "\r\n";
    for (const auto& a : args) {
        out += "$" + std::to_string(a.size()) + "\r\n";
        out += a + "\r\n";
    }
    return out;
}

static int64_t parse_length(std::string_view s) {
    if (s.empty()) throw std::runtime_error("resp: empty length");
    bool neg = false;
    size_t i = 0;
    if (s[0] == '-') { neg = true; i = 1; }
    if (i >= s.size()) throw std::runtime_error("resp: bad length");
    int64_t v = 0;
    for (; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9') throw std::runtime_error("resp: bad length");
        if (v > (INT64_MAX - 9) / 10) throw std::runtime_error("resp: length overflow");
        v = v * 10 + (s[i] - '0');
    }
    return neg ? -v : v;
}

static std::optional<RespValue> parse_single(std::string_view buf, size_t& pos) {
    if (pos >= buf.size()) return std::nullopt;
    char t = buf[pos];
    size_t e = buf.find("\r\n", pos + 1);
    if (e == std::string_view::npos) return std::nullopt;
    std::string_view line = buf.substr(pos + 1, e - pos - 1);
    size_t next = e + 2;
    RespValue v;
    switch (t) {
        case '+': v.type = RespType::SimpleString; v.str = std::string(line); pos = next; return v;
        case '-': v.type = RespType::Error; v.str = std::string(line); pos = next; return v;
        case ':': v.type = RespType::Integer; v.integer = parse_length(line); pos = next; return v;
        case '$': {
            int64_t len = parse_length(line);
            if (len == -1) { v.type = RespType::Null; pos = next; return v; }
            if (len < 0 || len > MAX_BULK) throw std::runtime_error("resp: bulk length out of range");
            if (next + static_cast<size_t>(len) + 2 > buf.size()) return std::nullopt;
            if (buf.substr(next + static_cast<size_t>(len), 2) != "\r\n") throw std::runtime_error("resp: bulk not terminated");
            v.type = RespType::BulkString;
            v.str = std::string(buf.substr(next, static_cast<size_t>(len)));
            pos = next + static_cast<size_t>(len) + 2;
            return v;
        }
        case '*': {
            int64_t cnt = parse_length(line);
            if (cnt == -1) { v.type = RespType::Null; pos = next; return v; }
            if (cnt < 0 || cnt > MAX_ARRAY) throw std::runtime_error("resp: array length out of range");
            v.type = RespType::Array;
            size_t p = next;
            for (int64_t i = 0; i < cnt; ++i) {
                auto elem = parse_single(buf, p);
                if (!elem.has_value()) return std::nullopt;
                v.arr.push_back(std::move(*elem));
            }
            pos = p;
            return v;
        }
        default:
            throw std::runtime_error("resp: unknown reply type");
    }
}

std::optional<RespValue> resp_parse_prefix(std::string_view buf, std::size_t& consumed) {
    size_t pos = 0;
    auto v = parse_single(buf, pos);
    if (v.has_value()) consumed = pos;
    return v;
}

std::optional<RespValue> resp_parse(const std::string& buf) {
    try {
        size_t consumed = 0;
        return resp_parse_prefix(buf, consumed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}
