#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "common/errors.hpp"
#include "common/types.hpp"
#include "core/clock.hpp"
#include "execution/gateways.hpp"
#include "market_data/streams.hpp"
#include "market_data/venue_query.hpp"

namespace tarb {
namespace testing_support {

// Wall and steady time that only move when somebody sleeps
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t epoch_start) : epoch_ns_(epoch_start * 1000000000LL) {}

    int64_t epoch_seconds() const override { return epoch_ns_.load() / 1000000000LL; }
    Timestamp steady_now() const override { return Timestamp(std::chrono::nanoseconds(epoch_ns_.load())); }
    void sleep_for(Duration d) override { epoch_ns_ += d.count(); }

    void set_epoch(int64_t secs) { epoch_ns_ = secs * 1000000000LL; }

private:
    std::atomic<int64_t> epoch_ns_;
};

inline Market make_market(const std::string& cid, const std::string& question,
                          const std::string& up_token, const std::string& down_token) {
    Market m;
    m.condition_id = cid;
    m.question = question;
    m.active = true;
    m.closed = false;
    m.tokens = {MarketToken{up_token, "Up", false}, MarketToken{down_token, "Down", false}};
    return m;
}

inline void resolve(Market& m, const std::string& winning_outcome) {
    m.closed = true;
    for (auto& t : m.tokens) {
        t.winner = (t.outcome == winning_outcome);
    }
}

class FakeVenue : public VenueQuery {
public:
    std::optional<Market> get_market_by_slug(const std::string& slug) override {
        std::lock_guard<std::mutex> lock(mutex_);
        slug_lookups.push_back(slug);
        if (fail_lookups) throw std::runtime_error("gamma unavailable");
        auto it = by_slug.find(slug);
        if (it == by_slug.end()) return std::nullopt;
        return it->second;
    }

    Market get_market(const std::string& condition_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++market_calls;
        if (market_failures > 0) {
            --market_failures;
            throw std::runtime_error("clob unavailable");
        }
        auto it = by_cid.find(condition_id);
        if (it == by_cid.end()) throw std::runtime_error("unknown market " + condition_id);
        return it->second;
    }

    std::optional<Quote> get_best_prices(const std::string& token_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books.find(token_id);
        if (it == books.end()) return std::nullopt;
        return it->second;
    }

    void add(const std::string& slug, const Market& m) {
        by_slug[slug] = m;
        by_cid[m.condition_id] = m;
    }

    std::map<std::string, Market> by_slug;
    std::map<std::string, Market> by_cid;
    std::map<std::string, Quote> books;
    std::vector<std::string> slug_lookups;
    bool fail_lookups{false};
    int market_failures{0};
    int market_calls{0};

private:
    std::mutex mutex_;
};

// Orders run on worker threads, so everything here is locked
class FakeOrderGateway : public OrderGateway {
public:
    OrderResponse place_order(const OrderRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (throw_configuration) {
            throw ConfigurationError("no api credentials");
        }
        OrderResponse response;
        if (failing_tokens.count(request.token_id) > 0) {
            response.error_message = "not enough balance";
            return response;
        }
        response.success = true;
        response.order_id = "order-" + std::to_string(requests.size());
        return response;
    }

    size_t request_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests.size();
    }

    std::vector<OrderRequest> requests;
    std::set<std::string> failing_tokens;
    bool throw_configuration{false};

private:
    std::mutex mutex_;
};

class FakeSettlement : public SettlementGateway {
public:
    bool redeem(const RedemptionTarget& target) override {
        if (throw_on_redeem) throw std::runtime_error("relayer down");
        redeemed.push_back(target);
        return accept;
    }

    std::vector<RedemptionTarget> redeemed;
    bool accept{true};
    bool throw_on_redeem{false};
};

class FakeSubscription : public QuoteSubscription {
public:
    FakeSubscription(std::mutex& mutex, int& cancels) : mutex_(mutex), cancels_(cancels) {}
    void cancel() override {
        if (!cancelled_) {
            cancelled_ = true;
            std::lock_guard<std::mutex> lock(mutex_);
            ++cancels_;
        }
    }

private:
    std::mutex& mutex_;
    int& cancels_;
    bool cancelled_{false};
};

// Symbol threads subscribe concurrently
class FakeOrderBookStream : public OrderBookStream {
public:
    std::unique_ptr<QuoteSubscription> subscribe(const std::vector<std::string>& token_ids) override {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions.push_back(token_ids);
        return std::make_unique<FakeSubscription>(mutex_, cancels);
    }

    std::vector<std::vector<std::string>> subscriptions;
    int cancels{0};

private:
    std::mutex mutex_;
};

class FakeReferenceStream : public ReferencePriceStream {
public:
    void start() override { ++starts; }
    void stop() override { ++stops; }

    int starts{0};
    int stops{0};
};

} // namespace testing_support
} // namespace tarb
