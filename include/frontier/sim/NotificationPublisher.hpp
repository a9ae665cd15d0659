#pragma once
// include/frontier/sim/NotificationPublisher.hpp
//
// Adapter between the core's returned EventLists and notification sinks.
// publish() hands the batch to a background task and returns immediately;
// inside the task an entt::dispatcher fans each event out to every sink.
// A sink that throws is logged and skipped, never retried.

#include "frontier/jobs/JobSystem.hpp"
#include "frontier/sim/Boundary.hpp"
#include "frontier/sim/Events.hpp"

#include <entt/entt.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace frontier {

class NotificationPublisher {
public:
    explicit NotificationPublisher(jobs::JobSystem& jobs);
    ~NotificationPublisher();

    NotificationPublisher(const NotificationPublisher&) = delete;
    NotificationPublisher& operator=(const NotificationPublisher&) = delete;

    void addSink(std::shared_ptr<INotificationSink> sink);

    // Fire-and-forget.
    void publish(EventList events);

    // Blocks until every batch handed to publish() so far was delivered.
    void flush();

    [[nodiscard]] std::size_t delivered() const noexcept { return delivered_.load(); }
    [[nodiscard]] std::size_t failures() const noexcept { return failures_.load(); }

private:
    void deliverBatch(const EventList& events);
    void onEvent(const Event& event);

    jobs::JobSystem& jobs_;
    std::mutex mutex_;      // guards dispatcher_ and sinks_
    entt::dispatcher dispatcher_;
    std::vector<std::shared_ptr<INotificationSink>> sinks_;

    std::mutex pendingMutex_;
    std::condition_variable idle_;
    std::size_t inFlight_ = 0;

    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> failures_{0};
};

} // namespace frontier
