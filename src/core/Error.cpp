#include "frontier/core/Error.hpp"

#include <nlohmann/json.hpp>

namespace frontier {

ErrorCategory ErrorCategoryOf(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::InvalidArgument:
    case ErrorCode::UnknownStructureType:
    case ErrorCode::MissingTile:
    case ErrorCode::MissingSlot:
    case ErrorCode::InvalidSlot:
    case ErrorCode::TileNotOwned:
    case ErrorCode::InvalidAmount:
    case ErrorCode::SameSettlement:
        return ErrorCategory::Validation;

    case ErrorCode::PrerequisitesNotMet:
    case ErrorCode::PopulationTooLow:
    case ErrorCode::SlotOccupied:
    case ErrorCode::SlotReserved:
    case ErrorCode::QueueFull:
    case ErrorCode::InsufficientResources:
    case ErrorCode::InsufficientArea:
    case ErrorCode::TownHallLevelTooLow:
    case ErrorCode::UniqueConstraintViolated:
    case ErrorCode::MaxLevelReached:
    case ErrorCode::UpgradeInProgress:
    case ErrorCode::NotCancellable:
    case ErrorCode::ConflictState:
    case ErrorCode::NothingToRepair:
        return ErrorCategory::Precondition;

    case ErrorCode::SettlementNotFound:
    case ErrorCode::StructureNotFound:
    case ErrorCode::QueueItemNotFound:
    case ErrorCode::DisasterNotFound:
        return ErrorCategory::NotFound;

    case ErrorCode::NotSettlementOwner:
        return ErrorCategory::Conflict;

    case ErrorCode::PersistenceFailed:
    case ErrorCode::NotificationFailed:
        return ErrorCategory::Internal;
    }
    return ErrorCategory::Internal;
}

const char* ErrorCategoryName(ErrorCategory c) noexcept
{
    switch (c)
    {
    case ErrorCategory::Validation:   return "VALIDATION";
    case ErrorCategory::Precondition: return "PRECONDITION";
    case ErrorCategory::NotFound:     return "NOT_FOUND";
    case ErrorCategory::Conflict:     return "CONFLICT";
    case ErrorCategory::Internal:     return "INTERNAL";
    }
    return "INTERNAL";
}

const char* ErrorCodeName(ErrorCode code) noexcept
{
    switch (code)
    {
    case ErrorCode::InvalidArgument:          return "INVALID_ARGUMENT";
    case ErrorCode::UnknownStructureType:     return "UNKNOWN_STRUCTURE_TYPE";
    case ErrorCode::MissingTile:              return "MISSING_TILE";
    case ErrorCode::MissingSlot:              return "MISSING_SLOT";
    case ErrorCode::InvalidSlot:              return "INVALID_SLOT";
    case ErrorCode::TileNotOwned:             return "TILE_NOT_OWNED";
    case ErrorCode::InvalidAmount:            return "INVALID_AMOUNT";
    case ErrorCode::SameSettlement:           return "SAME_SETTLEMENT";
    case ErrorCode::PrerequisitesNotMet:      return "PREREQUISITES_NOT_MET";
    case ErrorCode::PopulationTooLow:         return "POPULATION_TOO_LOW";
    case ErrorCode::SlotOccupied:             return "SLOT_OCCUPIED";
    case ErrorCode::SlotReserved:             return "SLOT_RESERVED";
    case ErrorCode::QueueFull:                return "QUEUE_FULL";
    case ErrorCode::InsufficientResources:    return "INSUFFICIENT_RESOURCES";
    case ErrorCode::InsufficientArea:         return "INSUFFICIENT_AREA";
    case ErrorCode::TownHallLevelTooLow:      return "TOWN_HALL_LEVEL_TOO_LOW";
    case ErrorCode::UniqueConstraintViolated: return "UNIQUE_CONSTRAINT_VIOLATED";
    case ErrorCode::MaxLevelReached:          return "MAX_LEVEL_REACHED";
    case ErrorCode::UpgradeInProgress:        return "UPGRADE_IN_PROGRESS";
    case ErrorCode::NotCancellable:           return "NOT_CANCELLABLE";
    case ErrorCode::ConflictState:            return "CONFLICT_STATE";
    case ErrorCode::NothingToRepair:          return "NOTHING_TO_REPAIR";
    case ErrorCode::SettlementNotFound:       return "SETTLEMENT_NOT_FOUND";
    case ErrorCode::StructureNotFound:        return "STRUCTURE_NOT_FOUND";
    case ErrorCode::QueueItemNotFound:        return "QUEUE_ITEM_NOT_FOUND";
    case ErrorCode::DisasterNotFound:         return "DISASTER_NOT_FOUND";
    case ErrorCode::NotSettlementOwner:       return "NOT_SETTLEMENT_OWNER";
    case ErrorCode::PersistenceFailed:        return "PERSISTENCE_FAILED";
    case ErrorCode::NotificationFailed:       return "NOTIFICATION_FAILED";
    }
    return "UNKNOWN";
}

void to_json(nlohmann::json& j, const CommandError& e)
{
    j = nlohmann::json{
        {"code", ErrorCodeName(e.code)},
        {"category", ErrorCategoryName(e.category())},
        {"message", e.message},
    };

    if (!e.shortages.empty())
    {
        auto& arr = j["shortages"] = nlohmann::json::array();
        for (const ResourceShortage& s : e.shortages)
        {
            arr.push_back({
                {"resource", ResourceTypeName(s.type)},
                {"required", s.required},
                {"available", s.available},
                {"shortBy", s.shortBy()},
            });
        }
    }

    if (!e.missing.empty())
    {
        auto& arr = j["missing"] = nlohmann::json::array();
        for (const MissingPrerequisite& m : e.missing)
        {
            nlohmann::json item;
            if (!m.researchKey.empty())
            {
                item["research"] = m.researchKey;
            }
            else
            {
                item["structure"] = m.structureKey;
                item["requiredLevel"] = m.requiredLevel;
                item["currentLevel"] = m.currentLevel;
            }
            arr.push_back(std::move(item));
        }
    }
}

} // namespace frontier
