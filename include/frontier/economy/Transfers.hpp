#pragma once
// include/frontier/economy/Transfers.hpp
//
// Caravan transfers between settlements of the same world.
//
//   distance = round(euclidean)
//   travel   = distance * minutesPerUnit
//   loss %   = min(distance/100 * lossPer100 + (destination under impact ? disasterLoss : 0), maxLoss), rounded
//   received = floor(amount * (1 - loss/100))

#include "frontier/core/Config.hpp"
#include "frontier/core/Ids.hpp"
#include "frontier/core/Time.hpp"
#include "frontier/economy/Resources.hpp"

#include <nlohmann/json_fwd.hpp>

namespace frontier {

struct TransferQuote {
    int distance = 0;
    DurationMs travelTime = 0;
    int lossPercent = 0;
    double received = 0.0;
};

[[nodiscard]] TransferQuote QuoteTransfer(double fromX, double fromY, double toX, double toY,
                                          double amount, bool destinationUnderImpact,
                                          const SimConfig& cfg) noexcept;

struct Transfer {
    TransferId id = 0;
    SettlementId from = 0;
    SettlementId to = 0;
    ResourceType resource = ResourceType::Food;
    double amount = 0.0;        // debited from the source
    double received = 0.0;      // credited at arrival
    int lossPercent = 0;
    TimestampMs sentAt = 0;
    TimestampMs arrivesAt = 0;
};

void to_json(nlohmann::json& j, const Transfer& t);
void from_json(const nlohmann::json& j, Transfer& t);

} // namespace frontier
