#pragma once
// include/frontier/core/Config.hpp
//
// Tunables for the simulation core. Every number the rules use lives here so
// balance changes never require touching the engines.
//
// Loaded from JSON (comments allowed). Unknown keys are ignored, out-of-range
// values are clamped. Happiness weights must sum to 100 or the load fails.

#include "frontier/core/Time.hpp"
#include "frontier/economy/Resources.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace frontier {

struct HappinessWeights {
    double resourceSufficiency = 30.0;
    double housing             = 20.0;
    double preparedness        = 15.0;
    double trauma              = 15.0;
    double morale              = 15.0;
    double externalRelations   = 5.0;

    [[nodiscard]] double sum() const noexcept {
        return resourceSufficiency + housing + preparedness + trauma + morale + externalRelations;
    }
};

struct SimConfig {
    // --- clock ---
    double     tickRateHz           = 60.0;     // simulation ticks per second
    DurationMs orchestratorInterval = 1000;     // TickOrchestrator cadence

    // --- production / consumption ---
    double baseProductionRate    = 0.20;
    double worldMultiplier       = 1.0;
    double foodPerPersonPerTick  = 18.0 / 3600.0;
    double waterPerPersonPerTick = 36.0 / 3600.0;
    ResourceAmounts maintenancePerStructurePerTick = ResourceAmounts::Of(0.0, 0.0, 0.001, 0.0005, 0.00025);
    double baseStorageCapacity   = 1000.0;

    // --- construction ---
    int    queueConcurrency      = 1;   // IN_PROGRESS items per settlement
    int    queueMaxItems         = 11;  // QUEUED + IN_PROGRESS
    double emergencyCostFactor   = 2.5;
    double emergencyTimeFactor   = 0.5;
    double demolishRefundFactor  = 0.5;
    int    baseAreaCapacity      = 500;
    int    areaPerTownHallLevel  = 100;

    // --- population ---
    DurationMs growthInterval         = 30 * kMinuteMs;
    int        basePopulationCapacity = 10;
    HappinessWeights weights{};
    double immigrationThreshold       = 75.0;
    double emigrationThreshold        = 35.0;
    double starvationCeiling          = 55.0;
    double baseGrowthRate             = 0.02;
    double sufficiencyTargetHours     = 72.0;
    double foodPerPersonPerHour       = 0.3;
    double waterPerPersonPerHour      = 0.6;
    DurationMs traumaWindow           = 7 * kDayMs;

    // --- disasters ---
    DurationMs imminentThreshold      = 30 * kMinuteMs;
    DurationMs damageInterval         = 10 * kMinuteMs;
    DurationMs aftermathDuration      = 30 * kDayMs;
    DurationMs repairWindow           = 48 * kHourMs;
    double     repairDiscount         = 0.5;
    double     damageVariance         = 0.2;
    double     damageTargetChance     = 0.5;
    int        shelterCapacityPerLevel = 50;
    DurationMs passiveRepairInterval  = kHourMs;

    // --- transfers ---
    double transferLossPer100     = 5.0;   // percent per 100 distance units
    double transferDisasterLoss   = 10.0;  // percent when destination is under impact
    double transferMaxLoss        = 50.0;  // percent
    double transferMinutesPerUnit = 0.1;

    // --- runtime ---
    unsigned      workerThreads = 0;  // 0 = hardware concurrency
    std::uint64_t seed          = 0x5EEDF00Dull;

    // Length of one tick in ms (16.67 at 60 Hz).
    [[nodiscard]] double tickLengthMs() const noexcept { return 1000.0 / tickRateHz; }
};

// Parses JSON text into `out`. On failure `out` is untouched and `error` names the problem.
[[nodiscard]] bool ParseSimConfig(const std::string& text, SimConfig& out, std::string* error = nullptr);

// Returns false if the file is missing or invalid (callers keep defaults).
[[nodiscard]] bool LoadSimConfig(const std::filesystem::path& file, SimConfig& out, std::string* error = nullptr);

} // namespace frontier
