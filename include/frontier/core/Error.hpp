#pragma once
// include/frontier/core/Error.hpp
//
// Error taxonomy for commands and boundary failures.
//
//   VALIDATION    malformed/missing input, rejected before any mutation
//   PRECONDITION  state does not allow the command yet (retry after fixing it)
//   NOT_FOUND     referenced settlement/structure/item is absent
//   CONFLICT      actor does not own the settlement
//   INTERNAL      persistence/notification failure
//
// Every ErrorCode belongs to exactly one category (ErrorCategoryOf).

#include "frontier/economy/Resources.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace frontier {

enum class ErrorCategory : std::uint8_t {
    Validation = 0,
    Precondition,
    NotFound,
    Conflict,
    Internal,
};

enum class ErrorCode : std::uint8_t {
    // VALIDATION
    InvalidArgument = 0,
    UnknownStructureType,
    MissingTile,
    MissingSlot,
    InvalidSlot,
    TileNotOwned,
    InvalidAmount,
    SameSettlement,

    // PRECONDITION
    PrerequisitesNotMet,
    PopulationTooLow,
    SlotOccupied,
    SlotReserved,
    QueueFull,
    InsufficientResources,
    InsufficientArea,
    TownHallLevelTooLow,
    UniqueConstraintViolated,
    MaxLevelReached,
    UpgradeInProgress,
    NotCancellable,
    ConflictState,
    NothingToRepair,

    // NOT_FOUND
    SettlementNotFound,
    StructureNotFound,
    QueueItemNotFound,
    DisasterNotFound,

    // CONFLICT
    NotSettlementOwner,

    // INTERNAL
    PersistenceFailed,
    NotificationFailed,
};

[[nodiscard]] ErrorCategory ErrorCategoryOf(ErrorCode code) noexcept;
[[nodiscard]] const char* ErrorCategoryName(ErrorCategory c) noexcept; // "PRECONDITION"
[[nodiscard]] const char* ErrorCodeName(ErrorCode code) noexcept;      // "QUEUE_FULL"

struct ResourceShortage {
    ResourceType type = ResourceType::Food;
    double required   = 0.0;
    double available  = 0.0;

    [[nodiscard]] double shortBy() const noexcept { return required - available; }
};

struct MissingPrerequisite {
    std::string structureKey;   // empty when a research key is missing
    int requiredLevel = 0;
    int currentLevel  = 0;      // 0 = not built
    std::string researchKey;
};

struct CommandError {
    ErrorCode code = ErrorCode::InvalidArgument;
    std::string message;

    // Structured detail for user-facing rendering.
    std::vector<ResourceShortage> shortages;
    std::vector<MissingPrerequisite> missing;

    [[nodiscard]] ErrorCategory category() const noexcept { return ErrorCategoryOf(code); }
};

[[nodiscard]] inline CommandError MakeError(ErrorCode code, std::string message) {
    CommandError e;
    e.code = code;
    e.message = std::move(message);
    return e;
}

// {"code": "...", "category": "...", "message": "...", "shortages": [...], "missing": [...]}
void to_json(nlohmann::json& j, const CommandError& e);

// Value-or-error return for commands. T must not be CommandError.
template <class T>
class [[nodiscard]] Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(CommandError err) : data_(std::in_place_index<1>, std::move(err)) {}

    [[nodiscard]] bool ok() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    [[nodiscard]] const CommandError& error() const { return std::get<1>(data_); }
    [[nodiscard]] ErrorCode code() const { return error().code; }

private:
    std::variant<T, CommandError> data_;
};

using Status = Result<std::monostate>;

[[nodiscard]] inline Status Ok() { return Status(std::monostate{}); }

} // namespace frontier
