#include "arbitrage/leg_selector.hpp"

namespace tarb {

std::optional<ArbSelection> select_arb_legs(const LegAsks& asks, const LegTokens& tokens, double threshold) {
    if (asks.up_15 && asks.down_5 && (*asks.up_15 + *asks.down_5) < threshold) {
        return ArbSelection{
            ArbLeg{tokens.up_15, OUTCOME_UP, *asks.up_15},
            ArbLeg{tokens.down_5, OUTCOME_DOWN, *asks.down_5}
        };
    }

    if (asks.down_15 && asks.up_5 && (*asks.down_15 + *asks.up_5) < threshold) {
        return ArbSelection{
            ArbLeg{tokens.down_15, OUTCOME_DOWN, *asks.down_15},
            ArbLeg{tokens.up_5, OUTCOME_UP, *asks.up_5}
        };
    }

    return std::nullopt;
}

} // namespace tarb
