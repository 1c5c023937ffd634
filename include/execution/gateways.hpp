#pragma once

#include "common/types.hpp"

namespace tarb {

class OrderGateway {
public:
    virtual ~OrderGateway() = default;

    // Venue rejections and transport errors come back as success == false.
    // Throws ConfigurationError when order placement is not configured.
    virtual OrderResponse place_order(const OrderRequest& request) = 0;
};

/**
 * Hands winning positions to the external settlement process.
 * Submitting the same target twice must be harmless.
 */
class SettlementGateway {
public:
    virtual ~SettlementGateway() = default;
    virtual bool redeem(const RedemptionTarget& target) = 0;
};

} // namespace tarb
