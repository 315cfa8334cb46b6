#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

constexpr uint16_t kDefaultBridgePort = 1255;

struct BridgeConfig {
    std::string uid;
    std::string name = "HEOS Bridge";
    std::string host;
    uint16_t port = kDefaultBridgePort;
    std::chrono::seconds heartbeat{60};
};

struct AppConfig {
    BridgeConfig bridge;
    std::string log_level = "info";
    std::string snapshot_file = "system.json";
    bool auto_approve = true;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Both throw ConfigError on unreadable or malformed input.
AppConfig LoadConfig(std::string const& path);
AppConfig ParseConfig(std::string const& text);
