#include "system_client.h"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
namespace json = boost::json;

namespace {

std::string GetString(json::object const& obj, std::string_view key) {
    if (auto const* val = obj.if_contains(key)) {
        return json::value_to<std::string>(*val);
    }
    return {};
}

Player ParsePlayer(json::object const& obj) {
    Player player;
    player.pid = GetString(obj, "pid");
    player.name = GetString(obj, "name");
    player.model = GetString(obj, "model");
    player.ip = GetString(obj, "ip");
    return player;
}

Group ParseGroup(json::object const& obj) {
    Group group;
    group.gid = GetString(obj, "gid");
    group.name = GetString(obj, "name");
    if (auto const* members = obj.if_contains("members")) {
        group.members = json::value_to<std::vector<std::string>>(*members);
    }
    return group;
}

} // namespace

const char* ToString(BridgeEventType type) {
    switch (type) {
        case BridgeEventType::players_changed: return "players_changed";
        case BridgeEventType::groups_changed: return "groups_changed";
        case BridgeEventType::connection_lost: return "connection_lost";
        case BridgeEventType::connection_restored: return "connection_restored";
    }
    return "unknown";
}

class SnapshotClient : public ISystemClient, public std::enable_shared_from_this<SnapshotClient> {
public:
    SnapshotClient(net::any_io_executor executor, std::string path)
        : strand_(net::make_strand(executor))
        , timer_(strand_)
        , path_(std::move(path)) {}

    bool EstablishConnection(std::string const& host, uint16_t port, bool delayed) override {
        spdlog::debug("SnapshotClient: connect to {}:{} (snapshot {}){}", host, port, path_,
                      delayed ? ", delayed" : "");
        auto doc = ReadDocument();
        std::lock_guard lock{mutex_};
        connected_ = doc.has_value();
        return connected_;
    }

    void CloseConnection() override {
        std::lock_guard lock{mutex_};
        connected_ = false;
        net::post(strand_, [self = shared_from_this()] {
            self->listening_ = false;
            self->timer_.cancel();
        });
    }

    std::optional<PlayerMap> FetchPlayers() override {
        if (!IsConnected()) {
            return std::nullopt;
        }
        auto doc = ReadDocument();
        if (!doc) {
            return std::nullopt;
        }
        try {
            PlayerMap players;
            if (auto const* arr = doc->if_contains("players")) {
                for (auto const& entry : arr->as_array()) {
                    auto player = ParsePlayer(entry.as_object());
                    players.insert_or_assign(player.pid, std::move(player));
                }
            }
            return players;
        } catch (std::exception const& e) {
            spdlog::warn("SnapshotClient: bad players in {}: {}", path_, e.what());
            return std::nullopt;
        }
    }

    std::optional<GroupMap> FetchGroups() override {
        if (!IsConnected()) {
            return std::nullopt;
        }
        auto doc = ReadDocument();
        if (!doc) {
            return std::nullopt;
        }
        try {
            GroupMap groups;
            if (auto const* arr = doc->if_contains("groups")) {
                for (auto const& entry : arr->as_array()) {
                    auto group = ParseGroup(entry.as_object());
                    groups.insert_or_assign(group.gid, std::move(group));
                }
            }
            return groups;
        } catch (std::exception const& e) {
            spdlog::warn("SnapshotClient: bad groups in {}: {}", path_, e.what());
            return std::nullopt;
        }
    }

    void OnEvent(std::function<void(BridgeEvent const&)> callback) override {
        std::lock_guard lock{mutex_};
        callback_ = std::move(callback);
    }

    void StartEventListener(std::chrono::seconds heartbeat) override {
        net::post(strand_, [self = shared_from_this(), heartbeat] {
            self->heartbeat_ = heartbeat;
            if (self->listening_) {
                return;
            }
            self->listening_ = true;
            self->last_write_ = self->GetWriteTime();
            self->available_ = self->last_write_.has_value();
            self->ScheduleTimer();
        });
    }

private:
    bool IsConnected() const {
        std::lock_guard lock{mutex_};
        return connected_;
    }

    std::optional<json::object> ReadDocument() const {
        std::ifstream in(path_);
        if (!in) {
            spdlog::warn("SnapshotClient: cannot open {}", path_);
            return std::nullopt;
        }
        std::stringstream ss;
        ss << in.rdbuf();

        boost::system::error_code ec;
        json::value val = json::parse(ss.str(), ec);
        if (ec || !val.is_object()) {
            spdlog::warn("SnapshotClient: cannot parse {}: {}", path_, ec ? ec.message() : "not an object");
            return std::nullopt;
        }
        return val.as_object();
    }

    std::optional<fs::file_time_type> GetWriteTime() const {
        std::error_code ec;
        auto time = fs::last_write_time(path_, ec);
        if (ec) {
            return std::nullopt;
        }
        return time;
    }

    void ScheduleTimer() {
        timer_.expires_after(heartbeat_);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& e) {
            if (!e && self->listening_) {
                self->Poll();
                self->ScheduleTimer();
            }
        });
    }

    // Runs on the strand.
    void Poll() {
        auto write_time = GetWriteTime();
        if (!write_time) {
            if (available_) {
                available_ = false;
                Emit(BridgeEventType::connection_lost);
            }
            return;
        }
        if (!available_) {
            available_ = true;
            last_write_ = write_time;
            Emit(BridgeEventType::connection_restored);
            return;
        }
        if (write_time != last_write_) {
            last_write_ = write_time;
            Emit(BridgeEventType::players_changed);
        }
    }

    void Emit(BridgeEventType type) {
        std::function<void(BridgeEvent const&)> callback;
        {
            std::lock_guard lock{mutex_};
            callback = callback_;
        }
        spdlog::debug("SnapshotClient: event {}", ToString(type));
        if (callback) {
            callback(BridgeEvent{type});
        }
    }

private:
    net::strand<net::any_io_executor> strand_;
    net::steady_timer timer_;
    std::string path_;

    mutable std::mutex mutex_;
    bool connected_{false};
    std::function<void(BridgeEvent const&)> callback_;

    // Strand only.
    std::chrono::seconds heartbeat_{1};
    std::optional<fs::file_time_type> last_write_;
    bool available_{false};
    bool listening_{false};
};

std::shared_ptr<ISystemClient> CreateSnapshotClient(net::any_io_executor executor, std::string path) {
    return std::make_shared<SnapshotClient>(std::move(executor), std::move(path));
}
