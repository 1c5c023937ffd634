#pragma once

#include <string>
#include <set>
#include <vector>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "execution/gateways.hpp"

namespace tarb {

/**
 * Settlement hand-off through a JSON lines spool file. Each line is one
 * winning position for the external redeemer:
 *   {"condition_id": "...", "outcome": "Up", "queued_at": "2024-...Z"}
 * Targets already in the spool (from this run or an earlier one) are
 * acknowledged without writing a second line.
 */
class RedemptionQueue : public SettlementGateway {
public:
    explicit RedemptionQueue(const std::string& path);
    ~RedemptionQueue() override;

    bool redeem(const RedemptionTarget& target) override;

    // Targets currently in the spool, in file order
    std::vector<RedemptionTarget> pending() const;

    const std::string& path() const { return path_; }

private:
    void load_existing();

    std::string path_;
    std::ofstream file_;
    std::set<RedemptionTarget> queued_;
    mutable std::mutex mutex_;
};

void to_json(nlohmann::json& j, const RedemptionTarget& t);
void from_json(const nlohmann::json& j, RedemptionTarget& t);

} // namespace tarb
