#include "Config.h"
#include <cstdlib>
#include <string>
#include <cstdint>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

// keeps def when v is not a whole integer in [lo, hi]
static int parse_int_or(const char* name, const std::string& v, int def, int lo, int hi) {
    if (v.empty()) return def;
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if (used == v.size() && n >= lo && n <= hi) return n;
    } catch (const std::exception&) {
    }
    std::cerr << "config: ignoring invalid " << name << "=" << v << "\n";
    return def;
}

// single-quoted libpq conninfo value
static std::string conninfo_value(const std::string& v) {
    std::string out = "'";
    for (char c : v) {
        if (c == '\'' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string Config::conninfo() const {
    if (!database_url.empty()) return database_url;
    std::string ci;
    auto add = [&ci](const char* k, const std::string& v) {
        if (v.empty()) return;
        if (!ci.empty()) ci.push_back(' ');
        ci += k; ci.push_back('='); ci += conninfo_value(v);
    };
    add("host", db_host);
    add("port", std::to_string(db_port));
    add("dbname", db_name);
    add("user", db_user);
    add("password", db_password);
    return ci;
}

bool Config::database_configured() const {
    return !database_url.empty() || !db_host.empty();
}

int Config::log_level_number() const {
    switch (log_level) {
        case LogLevel::DEBUG: return 1;
        case LogLevel::INFO: return 2;
        case LogLevel::WARN: return 3;
        case LogLevel::ERROR: return 4;
    }
    return 2;
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    c.port = static_cast<uint16_t>(parse_int_or("PORT", getenv_or("PORT", ""), c.port, 0, 65535));
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--port" && i+1 < argc) c.port = static_cast<uint16_t>(parse_int_or("--port", argv[i+1], c.port, 0, 65535));
    }
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.access_log = getenv_or("ACCESS_LOG", "1") != "0";

    c.database_url = getenv_or("DATABASE_URL", "");
    c.db_host = getenv_or("BD_A7_HOST", "");
    c.db_port = static_cast<uint16_t>(parse_int_or("BD_A7_PORT", getenv_or("BD_A7_PORT", ""), c.db_port, 1, 65535));
    c.db_name = getenv_or("BD_A7_NAME", "");
    c.db_user = getenv_or("BD_A7_USER", "");
    c.db_password = getenv_or("BD_A7_PASSWORD", "");
    c.db_workers = parse_int_or("DB_WORKERS", getenv_or("DB_WORKERS", ""), c.db_workers, INT32_MIN, INT32_MAX);
    c.db_workers = std::clamp(c.db_workers, 1, 64);

    c.redis_host = getenv_or("REDIS_HOST", "");
    c.redis_port = static_cast<uint16_t>(parse_int_or("REDIS_PORT", getenv_or("REDIS_PORT", ""), c.redis_port, 1, 65535));
    c.redis_db = parse_int_or("REDIS_DB", getenv_or("REDIS_DB", ""), c.redis_db, 0, 65535);
    c.redis_password = getenv_or("REDIS_PASSWORD", "");

    c.secret_key = getenv_or("SECRET_KEY", "");
    return c;
}

}
