#include "scheduler.h"

#include <atomic>
#include <optional>

#include <spdlog/spdlog.h>

namespace {

void RunGuarded(std::function<void()> const& task) {
    try {
        task();
    } catch (std::exception const& e) {
        spdlog::warn("Scheduler: job failed: {}", e.what());
    }
}

} // namespace

class TimerJob : public IScheduledJob, public std::enable_shared_from_this<TimerJob> {
public:
    TimerJob(net::any_io_executor executor, std::function<void()> task,
             std::optional<std::chrono::milliseconds> period)
        : strand_(net::make_strand(executor))
        , timer_(strand_)
        , task_(std::move(task))
        , period_(period) {}

    void Start(std::chrono::milliseconds initial_delay) {
        net::post(strand_, [self = shared_from_this(), initial_delay] {
            self->ScheduleTimer(initial_delay);
        });
    }

    void Cancel() override {
        if (cancelled_.exchange(true)) {
            return;
        }
        spdlog::trace("Scheduler: cancel job");
        net::post(strand_, [self = shared_from_this()] { self->timer_.cancel(); });
    }

    bool IsCancelled() const override {
        return cancelled_;
    }

private:
    void ScheduleTimer(std::chrono::milliseconds delay) {
        if (cancelled_) {
            return;
        }
        timer_.expires_after(delay);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& e) {
            if (e || self->cancelled_) {
                return;
            }
            RunGuarded(self->task_);
            if (self->period_) {
                self->ScheduleTimer(*self->period_);
            } else {
                self->cancelled_ = true;
            }
        });
    }

private:
    net::strand<net::any_io_executor> strand_;
    net::steady_timer timer_;
    std::function<void()> task_;
    std::optional<std::chrono::milliseconds> period_;
    std::atomic_bool cancelled_{false};
};

class Scheduler : public IScheduler {
public:
    explicit Scheduler(net::any_io_executor executor) : executor_(std::move(executor)) {}

    void Post(std::function<void()> task) override {
        net::post(executor_, [task = std::move(task)] { RunGuarded(task); });
    }

    std::shared_ptr<IScheduledJob> Schedule(std::function<void()> task,
                                            std::chrono::milliseconds delay) override {
        auto job = std::make_shared<TimerJob>(executor_, std::move(task), std::nullopt);
        job->Start(delay);
        return job;
    }

    std::shared_ptr<IScheduledJob> ScheduleWithFixedDelay(std::function<void()> task,
                                                          std::chrono::milliseconds initial_delay,
                                                          std::chrono::milliseconds delay) override {
        auto job = std::make_shared<TimerJob>(executor_, std::move(task), delay);
        job->Start(initial_delay);
        return job;
    }

private:
    net::any_io_executor executor_;
};

std::shared_ptr<IScheduler> CreateScheduler(net::any_io_executor executor) {
    return std::make_shared<Scheduler>(std::move(executor));
}
