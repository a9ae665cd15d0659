#pragma once
// JSON (de)serialization of settlement state for persistence adapters.
// Unknown keys are ignored on read; missing ones keep their defaults.

#include "frontier/settlement/Settlement.hpp"

#include <nlohmann/json.hpp>

namespace frontier {

void to_json(nlohmann::json& j, const Tile& t);
void from_json(const nlohmann::json& j, Tile& t);

void to_json(nlohmann::json& j, const Structure& s);
void from_json(const nlohmann::json& j, Structure& s);

void to_json(nlohmann::json& j, const ConstructionQueueItem& q);
void from_json(const nlohmann::json& j, ConstructionQueueItem& q);

void to_json(nlohmann::json& j, const PopulationRecord& p);
void from_json(const nlohmann::json& j, PopulationRecord& p);

void to_json(nlohmann::json& j, const Settlement& s);
void from_json(const nlohmann::json& j, Settlement& s);

} // namespace frontier
