#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <utility>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/asio.hpp>
#include <string>
#include <thread>
#include <vector>

#include "config.h"
#include "engine.h"

// Bridge connects block a worker while backing off.
constexpr int kWorkerThreads = 2;

boost::asio::io_context io_context;

void handler(const boost::system::error_code& error, int signal_number) {
  if (!error) {
      spdlog::info("Signal {} received, stopping", signal_number);
      io_context.stop();
  }
}

int main(int argc, char* argv[]) {
    std::string config_path = "roomsync.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    AppConfig config;
    try {
        config = LoadConfig(config_path);
    } catch (ConfigError const& e) {
        spdlog::error("Bad configuration {}: {}", config_path, e.what());
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    auto inbox_logger = spdlog::stdout_color_mt("inbox");

    if (config.bridge.uid.empty()) {
        config.bridge.uid = "bridge-" + to_string(boost::uuids::random_generator()());
        spdlog::info("No bridge uid configured, using {}", config.bridge.uid);
    }

    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait(handler);

    auto engine = CreateEngine(io_context, config);
    engine->Start();

    std::vector<std::thread> workers;
    for (int i = 0; i < kWorkerThreads; ++i) {
        workers.emplace_back([] { io_context.run(); });
    }
    io_context.run();

    engine->Stop();
    for (auto& worker : workers) {
        worker.join();
    }
}
