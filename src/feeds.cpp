#include "paperdesk/feeds.hpp"

#include <algorithm>
#include <cstddef>

namespace paperdesk {

const char* to_string(FeedError error) {
    switch (error) {
        case FeedError::Unreachable: return "unreachable";
        case FeedError::HttpError: return "http_error";
        case FeedError::InvalidResponse: return "invalid_response";
        case FeedError::MissingPrice: return "missing_price";
    }
    return "unknown_feed_error";
}

StaticPriceFeed::StaticPriceFeed(std::map<std::string, double> prices) : prices_(std::move(prices)) {}

void StaticPriceFeed::set_price(const std::string& symbol, double price) {
    std::lock_guard<std::mutex> lock(mutex_);
    prices_[symbol] = price;
}

void StaticPriceFeed::remove(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    prices_.erase(symbol);
}

Result<Quote, FeedError> StaticPriceFeed::fetch_price(const std::string& symbol, std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prices_.find(symbol);
    if (it == prices_.end()) return FeedError::MissingPrice;
    if (!(it->second > 0.0)) return FeedError::InvalidResponse;
    return Quote{symbol, it->second};
}

StaticMarketFeed::StaticMarketFeed(std::vector<PredictionMarket> markets) : markets_(std::move(markets)) {}

void StaticMarketFeed::set_markets(std::vector<PredictionMarket> markets) {
    std::lock_guard<std::mutex> lock(mutex_);
    markets_ = std::move(markets);
}

Result<std::vector<PredictionMarket>, FeedError> StaticMarketFeed::fetch_markets(std::size_t limit,
                                                                                 std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PredictionMarket> out(markets_.begin(),
                                      markets_.begin() + static_cast<std::ptrdiff_t>(std::min(limit, markets_.size())));
    return out;
}

} // namespace paperdesk
