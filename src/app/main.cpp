// frontier_sim: founds a handful of demo settlements, drives the tick
// orchestrator over simulated time and prints what happened.

#include "app/CommandLineArgs.h"

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Config.hpp"
#include "frontier/core/Log.hpp"
#include "frontier/jobs/JobSystem.hpp"
#include "frontier/population/PopulationEngine.hpp"
#include "frontier/sim/CommandService.hpp"
#include "frontier/sim/InMemoryPersistence.hpp"
#include "frontier/sim/NotificationPublisher.hpp"
#include "frontier/sim/Rulebook.hpp"
#include "frontier/sim/TickOrchestrator.hpp"
#include "frontier/sim/World.hpp"

#include <array>
#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

using namespace frontier;

namespace {

// Tallies delivered events by name.
class EventTally final : public INotificationSink {
public:
    void deliver(const Event& event) override {
        std::lock_guard lock(mutex_);
        ++counts_[event.name()];
    }

    std::map<std::string, std::size_t> counts() const {
        std::lock_guard lock(mutex_);
        return counts_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::size_t> counts_;
};

struct DemoSite {
    const char* biome;
    const char* region;
    ResourceAmounts quality;
};

const std::array<DemoSite, 4> kSites{{
    {"GRASSLAND", "heartland", ResourceAmounts::Of(70, 60, 40, 30, 20)},
    {"FOREST",    "heartland", ResourceAmounts::Of(50, 60, 80, 30, 20)},
    {"MOUNTAIN",  "highlands", ResourceAmounts::Of(20, 50, 40, 80, 70)},
    {"COASTAL",   "shore",     ResourceAmounts::Of(60, 80, 30, 20, 10)},
}};

void LogFailure(const char* what, const CommandError& err)
{
    logsys::get()->warn("{} rejected: {} ({}) {}", what, ErrorCodeName(err.code), ErrorCategoryName(err.category()),
                        err.message);
}

} // namespace

int main(int argc, char** argv)
{
    const app::CommandLineArgs args = app::ParseCommandLineArgs(argc, argv);
    if (args.showHelp || !args.unknown.empty())
    {
        for (const std::string& u : args.unknown)
            std::cerr << "unknown or malformed argument: " << u << "\n";
        std::cout << app::BuildCommandLineHelpText();
        return args.unknown.empty() ? 0 : 2;
    }

    try
    {
        if (args.logDir)
            logsys::init(*args.logDir);
        else
            logsys::init_console();
        if (args.verbose)
            logsys::get()->set_level(spdlog::level::debug);
        auto log = logsys::get();

        SimConfig cfg;
        if (args.configPath)
        {
            std::string error;
            if (!LoadSimConfig(*args.configPath, cfg, &error))
            {
                log->error("Config '{}' rejected: {}", *args.configPath, error);
                return 1;
            }
        }
        if (args.seed)
            cfg.seed = static_cast<std::uint64_t>(*args.seed);
        if (args.threads)
            cfg.workerThreads = static_cast<unsigned>(*args.threads);

        StaticCatalog catalog = DefaultCatalog();
        if (args.catalogPath)
        {
            std::string error;
            if (!LoadCatalogFile(*args.catalogPath, catalog, &error))
            {
                log->error("Catalog '{}' rejected: {}", *args.catalogPath, error);
                return 1;
            }
        }
        log->info("Catalog v{}: {} structure definitions", catalog.version(), catalog.size());

        jobs::JobSystem jobs(cfg.workerThreads);
        Rulebook rules(cfg, catalog);
        World world(1, cfg.seed);
        InMemoryPersistence store;
        NotificationPublisher publisher(jobs);
        auto tally = std::make_shared<EventTally>();
        publisher.addSink(tally);

        CommandService commands(world, rules, store, &publisher);
        TickOrchestrator orchestrator(world, rules, jobs, store, &publisher);

        // --- found demo settlements ---
        const int count = args.settlements.value_or(4);
        std::vector<std::pair<PlayerId, SettlementId>> founded;
        for (int i = 0; i < count; ++i)
        {
            const DemoSite& site = kSites[static_cast<std::size_t>(i) % kSites.size()];
            FoundSettlementRequest req;
            req.owner = "player-" + std::to_string(i + 1);
            req.name = std::string(site.biome) + " outpost " + std::to_string(i + 1);
            req.x = (i % 4) * 150.0;
            req.y = (i / 4) * 150.0;
            req.homeTile.biome = site.biome;
            req.homeTile.region = site.region;
            req.homeTile.quality = site.quality;
            req.homeTile.slotCount = 6;

            const Result<SettlementId> sid = commands.foundSettlement(req, 0);
            if (!sid)
            {
                LogFailure("found-settlement", sid.error());
                continue;
            }
            founded.emplace_back(req.owner, sid.value());
        }

        // --- initial build orders ---
        for (const auto& [owner, sid] : founded)
        {
            SettlementContext* ctx = world.find(sid);
            TileId home = 0;
            {
                std::lock_guard lock(ctx->mutex);
                home = ctx->settlement.homeTile()->id;
            }

            const std::array<BuildRequest, 4> orders{{
                {"FARM", home, 0, false},
                {"WELL", home, 1, false},
                {"TENT", std::nullopt, std::nullopt, false},
                {"LUMBER_MILL", home, 2, false},
            }};
            for (const BuildRequest& order : orders)
            {
                const auto item = commands.submitConstruction(owner, sid, order, 0);
                if (!item)
                    LogFailure("submit-construction", item.error());
            }
        }

        if (founded.size() >= 2)
        {
            const auto& [owner, from] = founded[0];
            const auto sent = commands.initiateTransfer(owner, from, founded[1].second, ResourceType::Water, 20.0, 0);
            if (!sent)
                LogFailure("initiate-transfer", sent.error());
        }

        if (args.disaster)
        {
            DisasterEvent quake;
            quake.type = DisasterType::Earthquake;
            quake.severity = 55.0;
            quake.affectedRegions = {"heartland"};
            quake.scheduledAt = 8 * kHourMs;
            quake.warningDuration = 6 * kHourMs;
            quake.impactDuration = kHourMs;
            const DisasterId id = world.scheduleDisaster(quake);
            log->info("Scheduled disaster {} ({}) for t={}h", id, DisasterTypeName(quake.type), 8);
        }

        // --- drive ---
        const TimestampMs end = static_cast<TimestampMs>(args.hours.value_or(24)) * kHourMs;
        const DurationMs step = cfg.orchestratorInterval > 0 ? cfg.orchestratorInterval : 1000;

        int completed = 0;
        int transitions = 0;
        int failures = 0;
        for (TimestampMs now = step; now <= end; now += step)
        {
            const TickReport report = orchestrator.tick(now);
            completed += report.constructionsCompleted;
            transitions += report.disasterTransitions;
            failures += report.persistenceFailures;

            if (now % kHourMs == 0)
                log->debug("t={}h: {} events this tick", now / kHourMs, report.events.size());
        }
        publisher.flush();

        // --- summary ---
        log->info("Simulated {} h in {} ms steps: {} constructions, {} disaster transitions, {} commit failures",
                  end / kHourMs, step, completed, transitions, failures);
        for (SettlementContext* ctx : world.contexts())
        {
            std::lock_guard lock(ctx->mutex);
            const Settlement& s = ctx->settlement;
            const ResourceAmounts& r = s.storage.balances();
            log->info("  #{} {:<22} pop {:>3}/{:<3} happiness {:5.1f}  food {:7.1f} water {:7.1f} wood {:7.1f} "
                      "stone {:7.1f} ore {:7.1f}  structures {}",
                      s.id, s.name, s.population.count, PopulationCapacity(s, catalog, cfg), s.population.happiness,
                      r[ResourceType::Food], r[ResourceType::Water], r[ResourceType::Wood],
                      r[ResourceType::Stone], r[ResourceType::Ore], s.activeStructureCount());
        }
        for (const auto& [name, n] : tally->counts())
            log->info("  {:<30} {}", name, n);
        if (publisher.failures() > 0)
            log->warn("{} notification deliveries failed", publisher.failures());

        if (args.dumpPath)
        {
            std::ofstream out(*args.dumpPath);
            if (!out)
            {
                log->error("Cannot write dump '{}'", *args.dumpPath);
                return 1;
            }
            out << store.snapshot().dump(2) << '\n';
            log->info("State written to {}", *args.dumpPath);
        }

        spdlog::shutdown();
        return 0;
    }
    catch (const std::exception& e)
    {
        logsys::get()->critical("frontier_sim aborted: {}", e.what());
        spdlog::shutdown();
        return 1;
    }
}
