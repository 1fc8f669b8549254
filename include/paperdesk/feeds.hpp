#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "errors.hpp"
#include "types.hpp"

namespace paperdesk {

enum class FeedError {
    Unreachable,
    HttpError,
    InvalidResponse,
    MissingPrice
};

const char* to_string(FeedError error);

struct Quote {
    std::string symbol;   // as normalized by the feed
    double price = 0.0;
};

// Spot prices from an external source. Implementations must honour the
// timeout and must not touch the ledger.
class PriceFeed {
public:
    virtual ~PriceFeed() = default;
    virtual Result<Quote, FeedError> fetch_price(const std::string& symbol,
                                                 std::chrono::milliseconds timeout) = 0;
};

// Open prediction markets with their current odds.
class MarketFeed {
public:
    virtual ~MarketFeed() = default;
    virtual Result<std::vector<PredictionMarket>, FeedError> fetch_markets(std::size_t limit,
                                                                           std::chrono::milliseconds timeout) = 0;
};

// In-process price table. Used by the admin tool and tests.
class StaticPriceFeed : public PriceFeed {
public:
    StaticPriceFeed() = default;
    explicit StaticPriceFeed(std::map<std::string, double> prices);

    void set_price(const std::string& symbol, double price);
    void remove(const std::string& symbol);

    Result<Quote, FeedError> fetch_price(const std::string& symbol,
                                         std::chrono::milliseconds timeout) override;

private:
    std::mutex mutex_;
    std::map<std::string, double> prices_;
};

class StaticMarketFeed : public MarketFeed {
public:
    StaticMarketFeed() = default;
    explicit StaticMarketFeed(std::vector<PredictionMarket> markets);

    void set_markets(std::vector<PredictionMarket> markets);

    Result<std::vector<PredictionMarket>, FeedError> fetch_markets(std::size_t limit,
                                                                   std::chrono::milliseconds timeout) override;

private:
    std::mutex mutex_;
    std::vector<PredictionMarket> markets_;
};

} // namespace paperdesk
