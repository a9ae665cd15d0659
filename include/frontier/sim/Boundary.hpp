#pragma once
// include/frontier/sim/Boundary.hpp
//
// Collaborators the core talks to but does not implement.

#include "frontier/core/Ids.hpp"
#include "frontier/disaster/Disaster.hpp"
#include "frontier/economy/Transfers.hpp"
#include "frontier/settlement/Settlement.hpp"
#include "frontier/sim/Events.hpp"

#include <optional>
#include <string>
#include <vector>

namespace frontier {

// Everything one command or one settlement tick wants durable. Committed as a
// unit: a store must apply all of it or none of it.
struct UnitOfWork {
    std::vector<const Settlement*> settlements;
    std::vector<const DisasterEvent*> disasters;
    std::vector<Transfer> transfersOpened;
    std::vector<TransferId> transfersClosed;

    [[nodiscard]] bool empty() const noexcept {
        return settlements.empty() && disasters.empty() && transfersOpened.empty() && transfersClosed.empty();
    }
};

class IPersistence {
public:
    virtual ~IPersistence() = default;

    // Returns false (with `error`) if nothing was written.
    [[nodiscard]] virtual bool commit(const UnitOfWork& work, std::string* error) = 0;

    [[nodiscard]] virtual std::optional<Settlement> loadSettlement(SettlementId id) const = 0;
    [[nodiscard]] virtual std::vector<SettlementId> settlementIds() const = 0;

    [[nodiscard]] virtual std::optional<DisasterEvent> loadDisaster(DisasterId id) const = 0;
    [[nodiscard]] virtual std::vector<DisasterId> disasterIds() const = 0;
};

// Receives published events. May throw; the publisher logs and drops failures.
class INotificationSink {
public:
    virtual ~INotificationSink() = default;
    virtual void deliver(const Event& event) = 0;
};

} // namespace frontier
