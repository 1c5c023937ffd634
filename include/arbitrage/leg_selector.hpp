#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"

namespace tarb {

// Best asks of the four outcome tokens in the overlap
struct LegAsks {
    std::optional<Price> up_15;
    std::optional<Price> down_15;
    std::optional<Price> up_5;
    std::optional<Price> down_5;
};

struct LegTokens {
    std::string up_15;
    std::string down_15;
    std::string up_5;
    std::string down_5;
};

struct ArbLeg {
    std::string token_id;
    std::string outcome;
    Price price{0.0};
};

struct ArbSelection {
    ArbLeg leg_15;
    ArbLeg leg_5;

    Price sum() const { return leg_15.price + leg_5.price; }
};

/**
 * Pick the cross-tenor pair to buy, if any.
 *
 * Buying opposite outcomes on the two tenors pays at least 1.0 whenever the
 * two markets settle against the same move, so the pair is worth taking
 * when its combined ask is strictly under `threshold`:
 *   S1 = ask(15m Up) + ask(5m Down)
 *   S2 = ask(15m Down) + ask(5m Up)
 * A sum is only considered when both of its asks are known. S1 is checked
 * first.
 */
std::optional<ArbSelection> select_arb_legs(const LegAsks& asks, const LegTokens& tokens, double threshold);

} // namespace tarb
