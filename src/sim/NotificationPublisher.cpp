#include "frontier/sim/NotificationPublisher.hpp"

#include "frontier/core/Log.hpp"

#include <exception>
#include <utility>

namespace frontier {

NotificationPublisher::NotificationPublisher(jobs::JobSystem& jobs) : jobs_(jobs)
{
    dispatcher_.sink<Event>().connect<&NotificationPublisher::onEvent>(*this);
}

NotificationPublisher::~NotificationPublisher()
{
    flush();
    dispatcher_.sink<Event>().disconnect(*this);
}

void NotificationPublisher::addSink(std::shared_ptr<INotificationSink> sink)
{
    if (!sink)
        return;
    std::lock_guard lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void NotificationPublisher::publish(EventList events)
{
    if (events.empty())
        return;

    {
        std::lock_guard lock(pendingMutex_);
        ++inFlight_;
    }

    jobs_.SilentAsync([this, batch = std::move(events)]() {
        deliverBatch(batch);

        std::lock_guard lock(pendingMutex_);
        if (--inFlight_ == 0)
            idle_.notify_all();
    });
}

void NotificationPublisher::flush()
{
    std::unique_lock lock(pendingMutex_);
    idle_.wait(lock, [this] { return inFlight_ == 0; });
}

void NotificationPublisher::deliverBatch(const EventList& events)
{
    // One batch at a time through the dispatcher keeps per-sink order stable.
    std::lock_guard lock(mutex_);
    for (const Event& e : events)
        dispatcher_.trigger(e);
}

void NotificationPublisher::onEvent(const Event& event)
{
    for (const auto& sink : sinks_)
    {
        try
        {
            sink->deliver(event);
            delivered_.fetch_add(1, std::memory_order_relaxed);
        }
        catch (const std::exception& ex)
        {
            failures_.fetch_add(1, std::memory_order_relaxed);
            logsys::get()->warn("Notification '{}' for {} {} failed: {}", event.name(), ScopeKindName(event.scope),
                                event.scopeId, ex.what());
        }
    }
}

} // namespace frontier
