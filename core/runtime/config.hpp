#pragma once

#include <string>

#include "sim/sim_config.hpp"

namespace tangorest {
namespace runtime {

struct DirectoryConfig {
    std::string device = "sys/database/2";  // Entity identifier of the directory service
};

// Upper bound keeps the TTL representable as a steady_clock duration
constexpr double kMaxTtlSeconds = 7.0 * 24 * 3600;

struct CacheConfig {
    double ttl_seconds = 10.0;  // Lifetime of cached directory reads (> 0, <= kMaxTtlSeconds)
};

struct PoolConfig {
    int max_handles = 100;  // Connection pool capacity (>= 1)
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct ServiceConfig {
    DirectoryConfig directory;
    CacheConfig cache;
    PoolConfig pool;
    LoggingConfig logging;
    sim::SimulationConfig simulation;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, ServiceConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ServiceConfig &config, std::string &error);

}  // namespace runtime
}  // namespace tangorest
