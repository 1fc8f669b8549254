#include <gtest/gtest.h>
#include "paperdesk/symbols.hpp"
#include "paperdesk/types.hpp"

namespace symbols = paperdesk::symbols;
using paperdesk::ErrorCode;

namespace {

std::string normalized(const std::string& raw) {
    auto result = symbols::normalize_symbol(raw);
    return result.ok() ? result.value() : std::string("<") + paperdesk::to_string(result.error()) + ">";
}

} // namespace

TEST(SymbolsTest, EquitiesAreUpperCasedWithoutSpaces) {
    EXPECT_EQ(normalized("aapl"), "AAPL");
    EXPECT_EQ(normalized(" ms ft "), "MSFT");
    EXPECT_EQ(normalized("BRK.B"), "BRK.B");
    EXPECT_EQ(normalized("   "), "<invalid_symbol>");
}

TEST(SymbolsTest, CryptoPairsFoldToUsd) {
    EXPECT_EQ(normalized("btc"), "BTCUSD");
    EXPECT_EQ(normalized("BTC/USD"), "BTCUSD");
    EXPECT_EQ(normalized("eth-usdt"), "ETHUSD");
    EXPECT_EQ(normalized("SOL_USDC"), "SOLUSD");
    EXPECT_EQ(normalized("ETHUSDT"), "ETHUSD");
    EXPECT_EQ(normalized("ETH/BTC"), "ETHBTC");
    EXPECT_EQ(normalized("ETHBTC"), "ETHBTC");
}

TEST(SymbolsTest, ListedAliasesAndPreIpo) {
    EXPECT_EQ(normalized("figma"), "FIG");
    EXPECT_EQ(normalized("pre:openai"), "PRE:OPENAI");
    EXPECT_EQ(normalized("PRE:FIGMA"), "<preipo_symbol_already_listed>");
    EXPECT_EQ(normalized("PRE:"), "<invalid_symbol>");
    EXPECT_TRUE(symbols::is_preipo_symbol("pre:openai"));
}

TEST(SymbolsTest, OptionSymbols) {
    EXPECT_EQ(normalized("O:AAPL260320C00200000"), "AAPL260320C00200000");
    EXPECT_TRUE(symbols::is_option_symbol("aapl260320c00200000"));
    EXPECT_FALSE(symbols::is_option_symbol("AAPL"));
    EXPECT_DOUBLE_EQ(symbols::contract_multiplier("AAPL260320C00200000"), 100.0);
    EXPECT_DOUBLE_EQ(symbols::contract_multiplier("AAPL"), 1.0);
}

TEST(SymbolsTest, CryptoClassification) {
    EXPECT_TRUE(symbols::is_crypto_symbol("BTCUSD"));
    EXPECT_TRUE(symbols::is_crypto_symbol("eth/usdt"));
    EXPECT_TRUE(symbols::is_crypto_symbol("DOGE"));
    EXPECT_FALSE(symbols::is_crypto_symbol("AAPL"));
    EXPECT_FALSE(symbols::is_crypto_symbol("USD"));
    EXPECT_FALSE(symbols::is_crypto_symbol(""));
}

TEST(SymbolsTest, BuildsOccSymbol) {
    auto call = symbols::build_occ_option_symbol("aapl", "2026-03-20", "call", 200.0);
    ASSERT_TRUE(call.ok());
    EXPECT_EQ(call.value(), "AAPL260320C00200000");

    auto put = symbols::build_occ_option_symbol("SPY", "2026-06-19", "P", 512.5);
    ASSERT_TRUE(put.ok());
    EXPECT_EQ(put.value(), "SPY260619P00512500");
}

TEST(SymbolsTest, RejectsBadOptionComponents) {
    // 2026-03-21 is a Saturday.
    EXPECT_EQ(symbols::build_occ_option_symbol("AAPL", "2026-03-21", "C", 200.0).error(),
              ErrorCode::InvalidOptionSymbol);
    EXPECT_EQ(symbols::build_occ_option_symbol("AAPL", "2026-02-30", "C", 200.0).error(),
              ErrorCode::InvalidOptionSymbol);
    EXPECT_EQ(symbols::build_occ_option_symbol("AAPL", "2026-03-20", "X", 200.0).error(),
              ErrorCode::InvalidOptionSymbol);
    EXPECT_EQ(symbols::build_occ_option_symbol("AAPL", "2026-03-20", "C", 0.0).error(),
              ErrorCode::InvalidOptionSymbol);
    EXPECT_EQ(symbols::build_occ_option_symbol("TOOLONGX", "2026-03-20", "C", 200.0).error(),
              ErrorCode::InvalidOptionSymbol);
    EXPECT_EQ(symbols::build_occ_option_symbol("AAPL", "20260320", "C", 200.0).error(),
              ErrorCode::InvalidOptionSymbol);
}

TEST(SymbolsTest, SideParsing) {
    EXPECT_EQ(paperdesk::parse_side(" buy "), paperdesk::Side::Buy);
    EXPECT_EQ(paperdesk::parse_side("SELL"), paperdesk::Side::Sell);
    EXPECT_FALSE(paperdesk::parse_side("hold").has_value());
    EXPECT_STREQ(paperdesk::to_string(paperdesk::Side::Sell), "SELL");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
