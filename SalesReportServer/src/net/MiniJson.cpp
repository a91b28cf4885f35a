#include "MiniJson.h"
#include <stdexcept>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

const JsonValue* JsonValue::find(const std::string& key) const {
    if (type != Type::Object) return nullptr;
    for (const auto& p : obj) if (p.first == key) return &p.second;
    return nullptr;
}

namespace {

constexpr int MAX_DEPTH = 64;

struct Parser {
    std::string_view js;
    size_t i = 0;

    void skip_ws() { while (i < js.size() && std::isspace((unsigned char)js[i])) ++i; }

    char peek() {
        skip_ws();
        if (i >= js.size()) throw std::runtime_error("unexpected end of json");
        return js[i];
    }

    void expect(char c) {
        if (peek() != c) throw std::runtime_error(std::string("expected '") + c + "' in json");
        ++i;
    }

    void append_utf8(std::string& out, int code) {
        if (code <= 0x7f) out.push_back((char)code);
        else if (code <= 0x7ff) {
            out.push_back((char)(0xc0 | ((code >> 6) & 0x1f)));
            out.push_back((char)(0x80 | (code & 0x3f)));
        } else {
            out.push_back((char)(0xe0 | ((code >> 12) & 0x0f)));
            out.push_back((char)(0x80 | ((code >> 6) & 0x3f)));
            out.push_back((char)(0x80 | (code & 0x3f)));
        }
    }

    std::string parse_string() {
        expect('"');
        std::string out;
        for (;;) {
            if (i >= js.size()) throw std::runtime_error("unterminated json string");
            char c = js[i++];
            if (c == '"') return out;
            if ((unsigned char)c < 0x20) throw std::runtime_error("control character in json string");
            if (c != '\\') { out.push_back(c); continue; }
            if (i >= js.size()) throw std::runtime_error("unterminated escape in json string");
            char e = js[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    // BMP only
                    if (i + 4 > js.size()) throw std::runtime_error("invalid unicode escape in json string");
                    int code = 0;
                    for (size_t k = 0; k < 4; ++k) {
                        char ch = js[i + k];
                        code <<= 4;
                        if (ch >= '0' && ch <= '9') code += ch - '0';
                        else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
                        else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
                        else throw std::runtime_error("invalid hex in unicode escape");
                    }
                    i += 4;
                    append_utf8(out, code);
                    break;
                }
                default: throw std::runtime_error("unsupported escape in json string");
            }
        }
    }

    double parse_number() {
        size_t start = i;
        if (i < js.size() && js[i] == '-') ++i;
        size_t digits = i;
        while (i < js.size() && std::isdigit((unsigned char)js[i])) ++i;
        if (i == digits) throw std::runtime_error("invalid json number");
        if (js[digits] == '0' && i - digits > 1) throw std::runtime_error("leading zero in json number");
        if (i < js.size() && js[i] == '.') {
            ++i;
            size_t frac = i;
            while (i < js.size() && std::isdigit((unsigned char)js[i])) ++i;
            if (i == frac) throw std::runtime_error("invalid json number");
        }
        if (i < js.size() && (js[i] == 'e' || js[i] == 'E')) {
            ++i;
            if (i < js.size() && (js[i] == '+' || js[i] == '-')) ++i;
            size_t exp = i;
            while (i < js.size() && std::isdigit((unsigned char)js[i])) ++i;
            if (i == exp) throw std::runtime_error("invalid json number");
        }
        std::string tok(js.substr(start, i - start));
        return std::strtod(tok.c_str(), nullptr);
    }

    bool consume_literal(const char* lit) {
        std::string_view l(lit);
        if (js.substr(i, l.size()) != l) return false;
        i += l.size();
        return true;
    }

    JsonValue parse_value(int depth) {
        if (depth > MAX_DEPTH) throw std::runtime_error("json nested too deeply");
        JsonValue v;
        char c = peek();
        if (c == '{') {
            ++i;
            v.type = JsonValue::Type::Object;
            if (peek() == '}') { ++i; return v; }
            for (;;) {
                std::string key = parse_string();
                expect(':');
                v.obj.emplace_back(std::move(key), parse_value(depth + 1));
                char d = peek(); ++i;
                if (d == '}') return v;
                if (d != ',') throw std::runtime_error("expected ',' or '}' in json object");
            }
        }
        if (c == '[') {
            ++i;
            v.type = JsonValue::Type::Array;
            if (peek() == ']') { ++i; return v; }
            for (;;) {
                v.arr.push_back(parse_value(depth + 1));
                char d = peek(); ++i;
                if (d == ']') return v;
                if (d != ',') throw std::runtime_error("expected ',' or ']' in json array");
            }
        }
        if (c == '"') { v.type = JsonValue::Type::String; v.str = parse_string(); return v; }
        if (consume_literal("null")) return v;
        if (consume_literal("true")) { v.type = JsonValue::Type::Bool; v.boolean = true; return v; }
        if (consume_literal("false")) { v.type = JsonValue::Type::Bool; v.boolean = false; return v; }
        v.type = JsonValue::Type::Number;
        v.number = parse_number();
        return v;
    }
};

}

JsonValue json_parse(std::string_view js) {
    Parser p{js};
    JsonValue v = p.parse_value(0);
    p.skip_ws();
    if (p.i != js.size()) throw std::runtime_error("trailing characters after json value");
    return v;
}

// escape chars for JSON response strings; escapes control chars < 0x20 with \u00XX
std::string json_escape_resp(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size()+8);
    for (unsigned char uc : s) {
        if (uc == '"') { out += "\\\""; }
        else if (uc == '\\') { out += "\\\\"; }
        else if (uc == '\n') { out += "\\n"; }
        else if (uc == '\r') { out += "\\r"; }
        else if (uc == '\t') { out += "\\t"; }
        else if (uc < 0x20) {
            out.push_back('\\'); out.push_back('u'); out.push_back('0'); out.push_back('0');
            out.push_back(hex[(uc >> 4) & 0xF]); out.push_back(hex[uc & 0xF]);
        } else out.push_back((char)uc);
    }
    return out;
}

std::string json_emit_number(double v) {
    if (!std::isfinite(v)) return std::string("0");
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", v);
    if (std::strtod(buf, nullptr) != v) std::snprintf(buf, sizeof(buf), "%.17g", v);
    return std::string(buf);
}

std::string json_emit_string_or_null(const std::optional<std::string>& o) {
    if (!o.has_value()) return std::string("null");
    return "\"" + json_escape_resp(*o) + "\"";
}
