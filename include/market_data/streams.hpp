#pragma once

#include <string>
#include <vector>
#include <memory>

namespace tarb {

/**
 * Live quote subscription for a set of tokens. Cancelled on destruction.
 */
class QuoteSubscription {
public:
    virtual ~QuoteSubscription() = default;
    virtual void cancel() = 0;
};

/**
 * Pushes best bid/ask updates for subscribed tokens into the quote cache.
 */
class OrderBookStream {
public:
    virtual ~OrderBookStream() = default;
    virtual std::unique_ptr<QuoteSubscription> subscribe(const std::vector<std::string>& token_ids) = 0;
};

/**
 * Pushes oracle ticks into the reference price cache for the life of the process.
 */
class ReferencePriceStream {
public:
    virtual ~ReferencePriceStream() = default;
    virtual void start() = 0;
    virtual void stop() = 0;
};

} // namespace tarb
