#pragma once

#include <any>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <typeindex>
#include <vector>

#include <spdlog/spdlog.h>

// Typed publish/subscribe. Subscribers of one event type are called in
// registration order. Published events are queued; delivery happens in
// ProcessAll(), which is posted through the scheduler callback when one is set.
class EventBus {
public:
    EventBus() = default;
    EventBus(EventBus const&) = delete;
    EventBus& operator=(EventBus const&) = delete;

    template<typename T, typename ...Args>
    void Publish(Args&&... args) {
        std::function<void(std::function<void()>)> post;
        {
            std::lock_guard lock{mutex_};
            queue_.emplace_back(std::make_any<T>(std::forward<Args>(args)...));
            if (post_to_schedule_ && !in_scheduler_) {
                in_scheduler_ = true;
                post = post_to_schedule_;
            }
        }
        if (post) {
            post([this] { ProcessAll(); });
        }
    }

    template<typename T>
    int Subscribe(std::function<void(T const&)> callback) {
        int token = token_count_.fetch_add(1);
        std::lock_guard lock{mutex_};
        subscribers_.emplace(
            std::type_index{ typeid(T) },
            SubInfo {
                token,
                [cb = std::move(callback)] (std::any const& any) {
                    cb(std::any_cast<T const&>(any));
                }
            }
        );
        return token;
    }

    void Unsubscribe(int token) {
        std::lock_guard lock{mutex_};
        for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
            if (it->second.token == token) {
                subscribers_.erase(it);
                return;
            }
        }
    }

    size_t SubscriberCount() const {
        std::lock_guard lock{mutex_};
        return subscribers_.size();
    }

    void ProcessAll() {
        decltype(queue_) local_queue;
        {
            std::lock_guard lock{mutex_};
            in_scheduler_ = false;
            std::swap(queue_, local_queue);
        }
        spdlog::trace("EventBus: delivering {} events", local_queue.size());
        for (auto const& msg : local_queue) {
            std::vector<std::function<void(std::any const&)>> callbacks;
            {
                std::lock_guard lock{mutex_};
                auto [it, end] = subscribers_.equal_range(msg.type());
                for (; it != end; ++it) {
                    callbacks.push_back(it->second.cb);
                }
            }
            for (auto const& cb : callbacks) {
                try {
                    cb(msg);
                } catch (std::exception const& e) {
                    spdlog::warn("EventBus: subscriber failed: {}", e.what());
                }
            }
        }
    }

    void SetSchedulerCallback(std::function<void(std::function<void()>)> callback) {
        std::lock_guard lock{mutex_};
        post_to_schedule_ = std::move(callback);
    }

private:
    struct SubInfo {
        int token;
        std::function<void(std::any const&)> cb;
    };

    mutable std::mutex mutex_;
    std::vector<std::any> queue_;
    std::multimap<std::type_index, SubInfo> subscribers_;
    std::atomic_int token_count_{0};
    std::function<void(std::function<void()>)> post_to_schedule_;
    bool in_scheduler_{false};
};
