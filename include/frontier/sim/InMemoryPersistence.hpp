#pragma once
#include "frontier/sim/Boundary.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <mutex>

namespace frontier {

// Reference IPersistence: keeps the last committed JSON document per record.
// failNextCommits() makes the next N commits fail without writing anything.
class InMemoryPersistence final : public IPersistence {
public:
    [[nodiscard]] bool commit(const UnitOfWork& work, std::string* error) override;
    [[nodiscard]] std::optional<Settlement> loadSettlement(SettlementId id) const override;
    [[nodiscard]] std::vector<SettlementId> settlementIds() const override;
    [[nodiscard]] std::optional<DisasterEvent> loadDisaster(DisasterId id) const override;
    [[nodiscard]] std::vector<DisasterId> disasterIds() const override;

    void failNextCommits(std::size_t n);
    [[nodiscard]] std::size_t commits() const;
    [[nodiscard]] std::size_t openTransfers() const;

    // Whole store as one document (CLI --dump).
    [[nodiscard]] nlohmann::json snapshot() const;

private:
    mutable std::mutex mutex_;
    std::map<SettlementId, nlohmann::json> settlements_;
    std::map<DisasterId, nlohmann::json> disasters_;
    std::map<TransferId, nlohmann::json> transfers_;
    std::size_t failNext_ = 0;
    std::size_t commits_ = 0;
};

} // namespace frontier
