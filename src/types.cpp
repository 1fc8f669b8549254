#include "paperdesk/types.hpp"

#include <algorithm>
#include <cctype>
#include "paperdesk/symbols.hpp"

namespace paperdesk {

const char* to_string(Side side) {
    return side == Side::Buy ? "BUY" : "SELL";
}

std::optional<Side> parse_side(const std::string& text) {
    std::string upper;
    upper.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    if (upper == "BUY") return Side::Buy;
    if (upper == "SELL") return Side::Sell;
    return std::nullopt;
}

const PositionRecord* PositionBook::find(const std::string& symbol) const {
    auto it = records_.find(symbol);
    return it != records_.end() ? &it->second : nullptr;
}

double PositionBook::quantity(const std::string& symbol) const {
    const auto* record = find(symbol);
    return record ? record->quantity : 0.0;
}

void PositionBook::set(const std::string& symbol, double quantity, double avg_cost,
                       std::optional<double> multiplier) {
    if (quantity == 0.0) {
        records_.erase(symbol);
        return;
    }
    if (!multiplier) {
        const auto* existing = find(symbol);
        multiplier = existing ? existing->multiplier : symbols::contract_multiplier(symbol);
    }
    records_[symbol] = PositionRecord{quantity, avg_cost, *multiplier};
}

void PositionBook::erase(const std::string& symbol) {
    records_.erase(symbol);
}

const PolyBook::Outcomes* PolyBook::find(const std::string& market_id) const {
    auto it = markets_.find(market_id);
    return it != markets_.end() ? &it->second : nullptr;
}

double PolyBook::shares(const std::string& market_id, const std::string& outcome) const {
    const auto* outcomes = find(market_id);
    if (!outcomes) return 0.0;
    auto it = outcomes->find(outcome);
    return it != outcomes->end() ? it->second.shares : 0.0;
}

void PolyBook::add(const std::string& market_id, const std::string& outcome, double shares, double cost) {
    const auto* outcomes = find(market_id);
    PolyHolding current;
    if (outcomes) {
        auto it = outcomes->find(outcome);
        if (it != outcomes->end()) current = it->second;
    }
    set(market_id, outcome, current.shares + shares, current.cost_basis + cost);
}

void PolyBook::set(const std::string& market_id, const std::string& outcome, double shares, double cost_basis) {
    if (shares == 0.0) {
        auto it = markets_.find(market_id);
        if (it == markets_.end()) return;
        it->second.erase(outcome);
        if (it->second.empty()) markets_.erase(it);
        return;
    }
    markets_[market_id][outcome] = PolyHolding{shares, cost_basis};
}

bool PolyBook::erase(const std::string& market_id) {
    return markets_.erase(market_id) > 0;
}

bool PolyBook::has_open_position() const {
    return std::any_of(markets_.begin(), markets_.end(), [](const auto& entry) {
        return std::any_of(entry.second.begin(), entry.second.end(),
                           [](const auto& holding) { return holding.second.shares != 0.0; });
    });
}

} // namespace paperdesk
