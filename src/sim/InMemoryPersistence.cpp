#include "frontier/sim/InMemoryPersistence.hpp"

#include "frontier/sim/Serialization.hpp"

namespace frontier {

bool InMemoryPersistence::commit(const UnitOfWork& work, std::string* error)
{
    // Serialize first so a bad record never leaves a half-written store.
    std::map<SettlementId, nlohmann::json> settlements;
    for (const Settlement* s : work.settlements)
        settlements[s->id] = *s;
    std::map<DisasterId, nlohmann::json> disasters;
    for (const DisasterEvent* e : work.disasters)
        disasters[e->id] = *e;

    std::lock_guard lock(mutex_);
    if (failNext_ > 0)
    {
        --failNext_;
        if (error)
            *error = "injected commit failure";
        return false;
    }

    for (auto& [id, doc] : settlements)
        settlements_[id] = std::move(doc);
    for (auto& [id, doc] : disasters)
        disasters_[id] = std::move(doc);
    for (const Transfer& t : work.transfersOpened)
        transfers_[t.id] = t;
    for (TransferId id : work.transfersClosed)
        transfers_.erase(id);

    ++commits_;
    return true;
}

std::optional<Settlement> InMemoryPersistence::loadSettlement(SettlementId id) const
{
    std::lock_guard lock(mutex_);
    const auto it = settlements_.find(id);
    if (it == settlements_.end())
        return std::nullopt;
    return it->second.get<Settlement>();
}

std::vector<SettlementId> InMemoryPersistence::settlementIds() const
{
    std::lock_guard lock(mutex_);
    std::vector<SettlementId> ids;
    ids.reserve(settlements_.size());
    for (const auto& [id, doc] : settlements_)
        ids.push_back(id);
    return ids;
}

std::optional<DisasterEvent> InMemoryPersistence::loadDisaster(DisasterId id) const
{
    std::lock_guard lock(mutex_);
    const auto it = disasters_.find(id);
    if (it == disasters_.end())
        return std::nullopt;
    return it->second.get<DisasterEvent>();
}

std::vector<DisasterId> InMemoryPersistence::disasterIds() const
{
    std::lock_guard lock(mutex_);
    std::vector<DisasterId> ids;
    ids.reserve(disasters_.size());
    for (const auto& [id, doc] : disasters_)
        ids.push_back(id);
    return ids;
}

void InMemoryPersistence::failNextCommits(std::size_t n)
{
    std::lock_guard lock(mutex_);
    failNext_ = n;
}

std::size_t InMemoryPersistence::commits() const
{
    std::lock_guard lock(mutex_);
    return commits_;
}

std::size_t InMemoryPersistence::openTransfers() const
{
    std::lock_guard lock(mutex_);
    return transfers_.size();
}

nlohmann::json InMemoryPersistence::snapshot() const
{
    std::lock_guard lock(mutex_);
    nlohmann::json doc{
        {"settlements", nlohmann::json::array()},
        {"disasters", nlohmann::json::array()},
        {"transfers", nlohmann::json::array()},
    };
    for (const auto& [id, s] : settlements_)
        doc["settlements"].push_back(s);
    for (const auto& [id, e] : disasters_)
        doc["disasters"].push_back(e);
    for (const auto& [id, t] : transfers_)
        doc["transfers"].push_back(t);
    return doc;
}

} // namespace frontier
