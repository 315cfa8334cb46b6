#pragma once

#include "config.h"
#include "inbox.h"

#include <memory>
#include <vector>

#include <utility>

#include "boost/asio/io_context.hpp"

class IEngine {
public:
    // Connects the bridge and starts background discovery.
    virtual void Start() = 0;
    virtual void Stop() = 0;

    virtual std::vector<DiscoveryResult> GetResults() const = 0;
    virtual std::vector<Thing> GetThings() const = 0;

    virtual ~IEngine() = default;
};

// Every job runs on `io_context`; it must outlive the engine.
std::shared_ptr<IEngine> CreateEngine(boost::asio::io_context& io_context, AppConfig config);
