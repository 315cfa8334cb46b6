#include "config.h"

#include <fstream>
#include <limits>
#include <sstream>

#include <boost/json.hpp>
#include <fmt/format.h>

namespace json = boost::json;

namespace {

json::object const* GetObject(json::object const& obj, std::string_view key) {
    auto const* val = obj.if_contains(key);
    if (!val) {
        return nullptr;
    }
    if (!val->is_object()) {
        throw ConfigError(fmt::format("'{}' must be an object", key));
    }
    return &val->as_object();
}

template <typename T>
void Read(json::object const& obj, std::string_view key, T& out) {
    auto const* val = obj.if_contains(key);
    if (!val) {
        return;
    }
    try {
        out = json::value_to<T>(*val);
    } catch (std::exception const& e) {
        throw ConfigError(fmt::format("bad value for '{}': {}", key, e.what()));
    }
}

BridgeConfig ParseBridge(json::object const& obj) {
    BridgeConfig bridge;
    Read(obj, "uid", bridge.uid);
    Read(obj, "name", bridge.name);
    Read(obj, "host", bridge.host);

    int64_t port = bridge.port;
    Read(obj, "port", port);
    if (port <= 0 || port > std::numeric_limits<uint16_t>::max()) {
        throw ConfigError(fmt::format("bridge port {} out of range", port));
    }
    bridge.port = static_cast<uint16_t>(port);

    int64_t heartbeat = bridge.heartbeat.count();
    Read(obj, "heartbeat", heartbeat);
    if (heartbeat <= 0) {
        throw ConfigError(fmt::format("bridge heartbeat must be positive, got {}", heartbeat));
    }
    bridge.heartbeat = std::chrono::seconds{heartbeat};

    if (bridge.host.empty()) {
        throw ConfigError("bridge host is not set");
    }
    return bridge;
}

} // namespace

AppConfig ParseConfig(std::string const& text) {
    boost::system::error_code ec;
    json::value root = json::parse(text, ec);
    if (ec) {
        throw ConfigError(fmt::format("cannot parse config: {}", ec.message()));
    }
    if (!root.is_object()) {
        throw ConfigError("config must be a JSON object");
    }
    auto const& obj = root.as_object();

    AppConfig config;
    Read(obj, "log_level", config.log_level);
    Read(obj, "snapshot_file", config.snapshot_file);
    Read(obj, "auto_approve", config.auto_approve);

    auto const* bridge = GetObject(obj, "bridge");
    if (!bridge) {
        throw ConfigError("'bridge' section is missing");
    }
    config.bridge = ParseBridge(*bridge);
    return config;
}

AppConfig LoadConfig(std::string const& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError(fmt::format("cannot open config file {}", path));
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return ParseConfig(ss.str());
}
