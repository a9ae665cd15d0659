#pragma once
// World + engines + reference boundaries, wired the way the CLI wires them.

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Config.hpp"
#include "frontier/jobs/JobSystem.hpp"
#include "frontier/sim/CommandService.hpp"
#include "frontier/sim/InMemoryPersistence.hpp"
#include "frontier/sim/NotificationPublisher.hpp"
#include "frontier/sim/Rulebook.hpp"
#include "frontier/sim/TickOrchestrator.hpp"
#include "frontier/sim/World.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace frontier::testing {

class RecordingSink final : public INotificationSink {
public:
    void deliver(const Event& event) override
    {
        std::lock_guard lock(mutex_);
        events_.push_back(event);
    }

    [[nodiscard]] EventList events() const
    {
        std::lock_guard lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    EventList events_;
};

class ThrowingSink final : public INotificationSink {
public:
    void deliver(const Event&) override { throw std::runtime_error("transport down"); }
};

inline SimConfig FastConfig()
{
    SimConfig cfg;
    cfg.seed = 42;
    return cfg;
}

struct SimFixture {
    SimConfig cfg = FastConfig();
    StaticCatalog catalog = DefaultCatalog();
    Rulebook rules{cfg, catalog};
    World world{1, cfg.seed};
    InMemoryPersistence persistence;
    jobs::JobSystem jobs{2};
    NotificationPublisher publisher{jobs};
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    CommandService commands{world, rules, persistence, &publisher};
    TickOrchestrator orchestrator{world, rules, jobs, persistence, &publisher};

    SimFixture() { publisher.addSink(sink); }

    SettlementId found(const std::string& owner, double x = 0.0, double y = 0.0,
                       ResourceAmounts quality = ResourceAmounts::Of(50, 50, 50, 50, 50))
    {
        FoundSettlementRequest req;
        req.owner = owner;
        req.name = owner + "'s camp";
        req.x = x;
        req.y = y;
        req.homeTile.biome = "GRASSLAND";
        req.homeTile.region = "heartland";
        req.homeTile.quality = quality;
        req.homeTile.slotCount = 6;
        auto r = commands.foundSettlement(req, 0);
        REQUIRE(r);
        return r.value();
    }

    Settlement& settlement(SettlementId id) { return world.find(id)->settlement; }

    BuildRequest extractor(SettlementId id, const std::string& key, int slot)
    {
        BuildRequest req;
        req.structureKey = key;
        req.tileId = settlement(id).tiles.front().id;
        req.slot = slot;
        return req;
    }
};

} // namespace frontier::testing
