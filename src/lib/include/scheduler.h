#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <utility>

#include <boost/asio.hpp>

namespace net = boost::asio;

class IScheduledJob {
public:
    // Stops further runs. A run already in progress completes.
    virtual void Cancel() = 0;
    virtual bool IsCancelled() const = 0;

    virtual ~IScheduledJob() = default;
};

class IScheduler {
public:
    virtual void Post(std::function<void()> task) = 0;

    virtual std::shared_ptr<IScheduledJob> Schedule(std::function<void()> task,
                                                    std::chrono::milliseconds delay) = 0;

    // Next run starts `delay` after the previous one finished.
    virtual std::shared_ptr<IScheduledJob> ScheduleWithFixedDelay(std::function<void()> task,
                                                                  std::chrono::milliseconds initial_delay,
                                                                  std::chrono::milliseconds delay) = 0;

    virtual ~IScheduler() = default;
};

std::shared_ptr<IScheduler> CreateScheduler(net::any_io_executor executor);
