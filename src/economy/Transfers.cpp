#include "frontier/economy/Transfers.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>

namespace frontier {

TransferQuote QuoteTransfer(double fromX, double fromY, double toX, double toY, double amount,
                            bool destinationUnderImpact, const SimConfig& cfg) noexcept
{
    TransferQuote q;
    q.distance = static_cast<int>(std::lround(std::hypot(toX - fromX, toY - fromY)));
    q.travelTime = static_cast<DurationMs>(
        std::llround(q.distance * cfg.transferMinutesPerUnit * static_cast<double>(kMinuteMs)));

    double loss = q.distance / 100.0 * cfg.transferLossPer100;
    if (destinationUnderImpact)
        loss += cfg.transferDisasterLoss;
    q.lossPercent = static_cast<int>(std::lround(std::min(loss, cfg.transferMaxLoss)));

    q.received = std::floor(amount * (1.0 - q.lossPercent / 100.0));
    return q;
}

void to_json(nlohmann::json& j, const Transfer& t)
{
    j = nlohmann::json{
        {"id", t.id},
        {"from", t.from},
        {"to", t.to},
        {"resource", ResourceTypeName(t.resource)},
        {"amount", t.amount},
        {"received", t.received},
        {"lossPercent", t.lossPercent},
        {"sentAt", t.sentAt},
        {"arrivesAt", t.arrivesAt},
    };
}

void from_json(const nlohmann::json& j, Transfer& t)
{
    t = Transfer{};
    t.id = j.value("id", TransferId{0});
    t.from = j.value("from", SettlementId{0});
    t.to = j.value("to", SettlementId{0});
    t.resource = ParseResourceType(j.value("resource", std::string("food"))).value_or(ResourceType::Food);
    t.amount = j.value("amount", 0.0);
    t.received = j.value("received", 0.0);
    t.lossPercent = j.value("lossPercent", 0);
    t.sentAt = j.value("sentAt", TimestampMs{0});
    t.arrivesAt = j.value("arrivesAt", TimestampMs{0});
}

} // namespace frontier
