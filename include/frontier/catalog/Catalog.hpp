#pragma once
// include/frontier/catalog/Catalog.hpp
//
// Read-only structure and biome data consumed by the simulation core.
//
// The engines never hardcode structure names. Rules that care about a kind of
// building (housing, shelters, the town hall...) look at StructureRole, and
// numbers such as housing capacity or staffing live on the definition.
//
// JSON format (ParseCatalog / LoadCatalogFile), entries merge over the base:
//
//   {
//     "version": 3,
//     "structures": [
//       { "key": "FARM", "name": "Farm", "category": "EXTRACTOR", "extracts": "food",
//         "cost": {"wood": 20, "stone": 10}, "buildSeconds": 180, "maxLevel": 0,
//         "staffing": {"required": 2, "optional": 3, "bonusPerWorker": 0.1, "priority": 10} }
//     ],
//     "biomes": { "GRASSLAND": {"food": 1.2, "water": 1.0} }
//   }

#include "frontier/core/Time.hpp"
#include "frontier/economy/Resources.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace frontier {

enum class StructureCategory : std::uint8_t {
    Extractor = 0,
    Building,
};

enum class StructureRole : std::uint8_t {
    None = 0,
    Housing,
    Storage,
    TownHall,
    Workshop,
    Marketplace,
    Hospital,
    Shelter,
    Watchtower,
    Defense,
};

[[nodiscard]] const char* StructureCategoryName(StructureCategory c) noexcept;
[[nodiscard]] const char* StructureRoleName(StructureRole r) noexcept;

struct Prerequisite {
    std::string structureKey;   // either a structure + level ...
    int level = 1;
    std::string researchKey;    // ... or a research unlock
};

struct StaffingRequirement {
    int    required       = 0;
    int    optional       = 0;
    double bonusPerWorker = 0.0;
    int    priority       = 0;
};

struct StructureDefinition {
    std::string key;            // "FARM"
    std::string name;           // "Farm"
    StructureCategory category = StructureCategory::Building;
    StructureRole role         = StructureRole::None;
    std::optional<ResourceType> extracts;   // extractors only

    ResourceAmounts cost{};
    DurationMs buildTime = 10 * kMinuteMs;
    int tier     = 1;
    int maxLevel = 0;           // 0 = unbounded

    // Building placement.
    int  areaCost         = 0;
    bool unique           = false;
    int  minTownHallLevel = 0;

    std::vector<Prerequisite> prerequisites;
    int populationRequirement = 0;

    // Effects (per level).
    int    housingCapacity = 0;
    double housingQuality  = 0.0;   // best housing present adds this to housing score
    double storageBonus    = 0.0;
    double defenseBonus    = 0.0;

    StaffingRequirement staffing{};

    [[nodiscard]] bool isExtractor() const noexcept { return category == StructureCategory::Extractor; }
};

// Boundary: structure definitions, biome efficiency, staffing tables.
class ICatalog {
public:
    virtual ~ICatalog() = default;

    [[nodiscard]] virtual const StructureDefinition* findStructure(std::string_view key) const = 0;
    [[nodiscard]] virtual double biomeEfficiency(std::string_view biome, ResourceType r) const = 0;
    [[nodiscard]] virtual int version() const noexcept = 0;

    [[nodiscard]] const StaffingRequirement* staffingFor(std::string_view key) const {
        const StructureDefinition* def = findStructure(key);
        return def ? &def->staffing : nullptr;
    }
};

class StaticCatalog final : public ICatalog {
public:
    StaticCatalog() = default;

    [[nodiscard]] const StructureDefinition* findStructure(std::string_view key) const override;
    [[nodiscard]] double biomeEfficiency(std::string_view biome, ResourceType r) const override;
    [[nodiscard]] int version() const noexcept override { return version_; }

    void upsert(StructureDefinition def);
    void setBiome(const std::string& biome, const ResourceAmounts& efficiency);
    void setVersion(int v) noexcept { version_ = v; }

    [[nodiscard]] std::vector<const StructureDefinition*> all() const;
    [[nodiscard]] std::size_t size() const noexcept { return structures_.size(); }

private:
    std::map<std::string, StructureDefinition, std::less<>> structures_;
    std::unordered_map<std::string, ResourceAmounts> biomes_;
    int version_ = 1;
};

// Built-in definitions (extractors, housing, civic buildings) and biome table.
[[nodiscard]] StaticCatalog DefaultCatalog();

// Merges JSON over `catalog`. Returns false (catalog untouched) on malformed input.
[[nodiscard]] bool ParseCatalog(const std::string& text, StaticCatalog& catalog, std::string* error = nullptr);

// Throws std::runtime_error if the file cannot be opened.
[[nodiscard]] bool LoadCatalogFile(const std::filesystem::path& file, StaticCatalog& catalog, std::string* error = nullptr);

} // namespace frontier
