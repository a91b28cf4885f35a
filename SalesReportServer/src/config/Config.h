#pragma once

#include <cstdint>
#include <string>

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    uint16_t port = 8083;
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    bool access_log = true;

    std::string database_url;
    std::string db_host;
    uint16_t db_port = 5432;
    std::string db_name;
    std::string db_user;
    std::string db_password;
    int db_workers = 4;

    std::string redis_host;
    uint16_t redis_port = 6379;
    int redis_db = 0;
    std::string redis_password;

    std::string secret_key;

    static constexpr int cache_ttl_sec = 300;
    static constexpr const char* cache_key_prefix = "vendas_realtime";
    static constexpr int business_utc_offset_min = -180;

    // libpq conninfo: DATABASE_URL when set, otherwise assembled from the BD_A7_* parts
    std::string conninfo() const;
    bool database_configured() const;
    int log_level_number() const;

    static Config from_env(int argc, char** argv);
};

}
