#include "paperdesk/config.hpp"
#include "paperdesk/ledger_service.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace {

void print_usage() {
    std::cout << "usage: paperdesk_admin <command> [args]\n"
              << "  leaderboard [limit]\n"
              << "  account <name|id>\n"
              << "  resolve <market_id> <outcome>\n"
              << "  purge <name|id>\n"
              << "  price <symbol> <price>" << std::endl;
}

void print_leaderboard(const std::vector<paperdesk::LeaderboardRow>& rows) {
    if (rows.empty()) {
        std::cout << "No ranked agents" << std::endl;
        return;
    }

    std::cout << "\n=== Leaderboard ===" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << std::setw(5) << "Rank"
              << std::setw(24) << "Agent"
              << std::setw(14) << "Equity"
              << std::setw(12) << "Cash"
              << std::setw(12) << "Stocks"
              << std::setw(12) << "Crypto"
              << std::setw(12) << "Poly"
              << std::setw(10) << "Return%" << std::endl;
    std::cout << std::string(101, '-') << std::endl;

    std::size_t rank = 1;
    for (const auto& row : rows) {
        const auto& v = row.valuation;
        std::cout << std::setw(5) << rank++
                  << std::setw(24) << row.display_name
                  << std::setw(14) << v.equity
                  << std::setw(12) << v.cash
                  << std::setw(12) << v.stock_value
                  << std::setw(12) << v.crypto_value
                  << std::setw(12) << v.poly_value
                  << std::setw(10) << v.return_pct << std::endl;
    }
    std::cout << "===================" << std::endl;
}

void print_account(const paperdesk::Account& account, const paperdesk::Valuation& valuation) {
    std::cout << "\n=== Account Summary ===" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Agent: " << account.display_name << " (" << account.id << ")" << std::endl;
    std::cout << "Cash: $" << account.cash << std::endl;
    std::cout << "Equity: $" << valuation.equity << std::endl;
    std::cout << "Return: " << valuation.return_pct << "%" << std::endl;
    std::cout << "Realized P&L: $" << account.realized_pnl << std::endl;
    std::cout << "Poly realized P&L: $" << account.poly_realized_pnl << std::endl;
    std::cout << "Blocked: " << (account.blocked ? "yes" : "no") << std::endl;

    if (account.positions.empty()) {
        std::cout << "No open positions" << std::endl;
    } else {
        std::cout << std::setw(22) << "Symbol"
                  << std::setw(12) << "Quantity"
                  << std::setw(12) << "Avg Cost"
                  << std::setw(12) << "Last"
                  << std::setw(14) << "Market Value" << std::endl;
        std::cout << std::string(72, '-') << std::endl;
        for (const auto& position : valuation.positions) {
            const auto* record = account.positions.find(position.symbol);
            std::cout << std::setw(22) << position.symbol
                      << std::setw(12) << position.quantity
                      << std::setw(12) << (record ? record->avg_cost : 0.0)
                      << std::setw(12) << position.last_price
                      << std::setw(14) << position.market_value << std::endl;
        }
    }

    for (const auto& [market_id, outcomes] : account.poly) {
        for (const auto& [outcome, holding] : outcomes) {
            std::cout << "Poly " << market_id << " " << outcome << ": " << holding.shares
                      << " shares, cost $" << holding.cost_basis << std::endl;
        }
    }
    std::cout << "=====================" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 2;
    }
    std::string command = argv[1];

    try {
        auto config = paperdesk::LedgerConfig::from_env();
        paperdesk::LedgerService service(config, std::make_shared<paperdesk::StaticPriceFeed>());

        if (command == "leaderboard") {
            std::size_t limit = argc > 2 ? static_cast<std::size_t>(std::stoul(argv[2])) : 20;
            print_leaderboard(service.leaderboard(limit));
            return 0;
        }

        if (command == "account" && argc > 2) {
            auto account = service.account(argv[2]);
            auto valuation = service.value(argv[2]);
            if (!account || !valuation) {
                spdlog::error("agent_not_found: {}", argv[2]);
                return 1;
            }
            print_account(*account, valuation.value());
            return 0;
        }

        if (command == "resolve" && argc > 3) {
            auto resolution = service.resolve_market(argv[2], argv[3]);
            if (!resolution) {
                spdlog::error("{}", paperdesk::to_string(resolution.error()));
                return 1;
            }
            std::cout << "Resolved " << resolution->market_id << " as " << resolution->winning_outcome << std::endl;
            std::cout << std::fixed << std::setprecision(4);
            for (const auto& payout : resolution->payouts) {
                std::cout << "  " << std::setw(24) << payout.display_name << std::setw(14) << payout.payout << std::endl;
            }
            return 0;
        }

        if (command == "purge" && argc > 2) {
            auto summary = service.purge(argv[2]);
            if (!summary) {
                spdlog::error("{}", paperdesk::to_string(summary.error()));
                return 1;
            }
            std::cout << "Purged " << summary->display_name << " (" << summary->account_id << ")\n"
                      << "  activity events:   " << summary->removed_activity_events << "\n"
                      << "  name mappings:     " << summary->removed_name_mappings << "\n"
                      << "  api keys:          " << summary->removed_key_to_agent << "\n"
                      << "  follows (out/in):  " << summary->removed_following_outgoing << "/"
                      << summary->removed_following_incoming << "\n"
                      << "  posts/comments:    " << summary->removed_forum_posts << "/"
                      << summary->removed_forum_comments << std::endl;
            return 0;
        }

        if (command == "price" && argc > 3) {
            auto status = service.set_price(argv[2], std::stod(argv[3]));
            if (!status) {
                spdlog::error("{}", paperdesk::to_string(status.error()));
                return 1;
            }
            std::cout << "Price set" << std::endl;
            return 0;
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    print_usage();
    return 2;
}
