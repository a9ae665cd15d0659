#include "frontier/core/Config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace frontier {

namespace {

using json = nlohmann::json;

const json* Section(const json& j, const char* name)
{
    const auto it = j.find(name);
    return (it != j.end() && it->is_object()) ? &*it : nullptr;
}

void ReadNumber(const json* sec, const char* key, double& out, double lo, double hi)
{
    if (!sec) return;
    if (const auto it = sec->find(key); it != sec->end() && it->is_number())
        out = std::clamp(it->get<double>(), lo, hi);
}

void ReadInt(const json* sec, const char* key, int& out, int lo, int hi)
{
    if (!sec) return;
    if (const auto it = sec->find(key); it != sec->end() && it->is_number_integer())
        out = std::clamp(it->get<int>(), lo, hi);
}

// Durations are written in human units in the file ("growthIntervalMinutes": 30).
void ReadDuration(const json* sec, const char* key, DurationMs& out, DurationMs unit, double lo, double hi)
{
    if (!sec) return;
    if (const auto it = sec->find(key); it != sec->end() && it->is_number())
        out = static_cast<DurationMs>(std::llround(std::clamp(it->get<double>(), lo, hi) * static_cast<double>(unit)));
}

bool ReadFileToString(const std::filesystem::path& p, std::string& out)
{
    std::ifstream f(p, std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

} // namespace

bool ParseSimConfig(const std::string& text, SimConfig& out, std::string* error)
{
    // Allow // comments, and avoid exceptions.
    const json j = json::parse(text, nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
    {
        if (error) *error = "config is not a JSON object";
        return false;
    }

    SimConfig tmp = out;

    if (const json* clock = Section(j, "clock"))
    {
        ReadNumber(clock, "tickRateHz", tmp.tickRateHz, 1.0, 1000.0);
        ReadDuration(clock, "orchestratorIntervalMs", tmp.orchestratorInterval, 1, 10.0, 3'600'000.0);
    }

    if (const json* prod = Section(j, "production"))
    {
        ReadNumber(prod, "baseRate", tmp.baseProductionRate, 0.0, 10.0);
        ReadNumber(prod, "worldMultiplier", tmp.worldMultiplier, 0.0, 1000.0);
        ReadNumber(prod, "foodPerPersonPerTick", tmp.foodPerPersonPerTick, 0.0, 10.0);
        ReadNumber(prod, "waterPerPersonPerTick", tmp.waterPerPersonPerTick, 0.0, 10.0);
        ReadNumber(prod, "baseStorageCapacity", tmp.baseStorageCapacity, 0.0, 1e12);
        if (const auto it = prod->find("maintenance"); it != prod->end() && it->is_object())
        {
            ResourceAmounts m = it->get<ResourceAmounts>();
            if (m.anyNegative())
            {
                if (error) *error = "production.maintenance must not be negative";
                return false;
            }
            tmp.maintenancePerStructurePerTick = m;
        }
    }

    if (const json* cons = Section(j, "construction"))
    {
        ReadInt(cons, "concurrency", tmp.queueConcurrency, 1, 16);
        ReadInt(cons, "maxItems", tmp.queueMaxItems, 1, 256);
        ReadNumber(cons, "emergencyCostFactor", tmp.emergencyCostFactor, 1.0, 100.0);
        ReadNumber(cons, "emergencyTimeFactor", tmp.emergencyTimeFactor, 0.01, 1.0);
        ReadNumber(cons, "demolishRefund", tmp.demolishRefundFactor, 0.0, 1.0);
        ReadInt(cons, "baseArea", tmp.baseAreaCapacity, 0, 1'000'000);
        ReadInt(cons, "areaPerTownHallLevel", tmp.areaPerTownHallLevel, 0, 1'000'000);
    }

    if (const json* pop = Section(j, "population"))
    {
        ReadDuration(pop, "growthIntervalMinutes", tmp.growthInterval, kMinuteMs, 1.0, 7 * 24 * 60.0);
        ReadInt(pop, "baseCapacity", tmp.basePopulationCapacity, 0, 1'000'000);
        ReadNumber(pop, "immigrationThreshold", tmp.immigrationThreshold, 0.0, 100.0);
        ReadNumber(pop, "emigrationThreshold", tmp.emigrationThreshold, 0.0, 100.0);
        ReadNumber(pop, "starvationCeiling", tmp.starvationCeiling, 0.0, 100.0);
        ReadNumber(pop, "baseGrowthRate", tmp.baseGrowthRate, 0.0, 1.0);
        ReadNumber(pop, "sufficiencyTargetHours", tmp.sufficiencyTargetHours, 1.0, 10'000.0);
        ReadDuration(pop, "traumaWindowDays", tmp.traumaWindow, kDayMs, 0.0, 365.0);

        if (const json* w = Section(*pop, "weights"))
        {
            HappinessWeights hw = tmp.weights;
            ReadNumber(w, "resourceSufficiency", hw.resourceSufficiency, 0.0, 100.0);
            ReadNumber(w, "housing", hw.housing, 0.0, 100.0);
            ReadNumber(w, "preparedness", hw.preparedness, 0.0, 100.0);
            ReadNumber(w, "trauma", hw.trauma, 0.0, 100.0);
            ReadNumber(w, "morale", hw.morale, 0.0, 100.0);
            ReadNumber(w, "externalRelations", hw.externalRelations, 0.0, 100.0);
            if (std::abs(hw.sum() - 100.0) > 1e-6)
            {
                if (error) *error = "population.weights must sum to 100";
                return false;
            }
            tmp.weights = hw;
        }
    }

    if (const json* dis = Section(j, "disasters"))
    {
        ReadDuration(dis, "imminentMinutes", tmp.imminentThreshold, kMinuteMs, 0.0, 24 * 60.0);
        ReadDuration(dis, "damageIntervalMinutes", tmp.damageInterval, kMinuteMs, 1.0, 24 * 60.0);
        ReadDuration(dis, "aftermathDays", tmp.aftermathDuration, kDayMs, 0.0, 365.0);
        ReadDuration(dis, "repairWindowHours", tmp.repairWindow, kHourMs, 0.0, 24 * 365.0);
        ReadNumber(dis, "repairDiscount", tmp.repairDiscount, 0.0, 1.0);
        ReadNumber(dis, "damageVariance", tmp.damageVariance, 0.0, 1.0);
        ReadNumber(dis, "damageTargetChance", tmp.damageTargetChance, 0.0, 1.0);
        ReadInt(dis, "shelterCapacityPerLevel", tmp.shelterCapacityPerLevel, 0, 100'000);
    }

    if (const json* tr = Section(j, "transfers"))
    {
        ReadNumber(tr, "lossPer100", tmp.transferLossPer100, 0.0, 100.0);
        ReadNumber(tr, "disasterLoss", tmp.transferDisasterLoss, 0.0, 100.0);
        ReadNumber(tr, "maxLoss", tmp.transferMaxLoss, 0.0, 100.0);
        ReadNumber(tr, "minutesPerUnit", tmp.transferMinutesPerUnit, 0.0, 1000.0);
    }

    if (const json* rt = Section(j, "runtime"))
    {
        if (const auto it = rt->find("workerThreads"); it != rt->end() && it->is_number_unsigned())
            tmp.workerThreads = std::min(it->get<unsigned>(), 256u);
        if (const auto it = rt->find("seed"); it != rt->end() && it->is_number_integer())
            tmp.seed = it->get<std::uint64_t>();
    }

    out = tmp;
    return true;
}

bool LoadSimConfig(const std::filesystem::path& file, SimConfig& out, std::string* error)
{
    std::string text;
    if (!ReadFileToString(file, text))
    {
        if (error) *error = "cannot open " + file.string();
        return false;
    }
    return ParseSimConfig(text, out, error);
}

} // namespace frontier
