#include "trade_statistics.hpp"
#include "position_sizing.hpp"
#include "symbols.hpp"
#include <gtest/gtest.h>

using core::OrderSide;
using core::OrderStatus;

namespace {

    constexpr core::Timestamp kT0 = 1704067200;

    core::Trade closedTrade(const std::string& id, OrderSide side, double entry, double exit,
                            double initial_sl, double pnl, long long duration) {
        core::Trade trade;
        trade.id = id;
        trade.symbol = "EURUSD";
        trade.side = side;
        trade.entry_price = entry;
        trade.initial_stop_loss = initial_sl;
        trade.stop_loss = initial_sl;
        trade.quantity = 1.0;
        trade.status = OrderStatus::Closed;
        trade.order_time = kT0;
        trade.entry_time = kT0;
        trade.close_time = kT0 + duration;
        trade.close_price = exit;
        trade.close_reason = core::CloseReason::Manual;
        trade.pnl = pnl;
        return trade;
    }

} // namespace

TEST(TradeStatisticsTest, SummarizesClosedTrades) {
    core::AccountState account;
    // +2R winner, -1R loser, a break-even and a short winner at +1R
    account.history.push_back(closedTrade("T-1", OrderSide::Long, 1.1000, 1.1100, 1.0950, 1000.0, 3600));
    account.history.push_back(closedTrade("T-2", OrderSide::Long, 1.1000, 1.0950, 1.0950, -500.0, 7200));
    account.history.push_back(closedTrade("T-3", OrderSide::Long, 1.1000, 1.1000, 1.0950, 0.0, 0));
    account.history.push_back(closedTrade("T-4", OrderSide::Short, 1.1000, 1.0950, 1.1050, 500.0, 1800));
    account.balance = 11000.0;
    account.max_drawdown = 650.0;

    const auto stats = trading::computeStatistics(account);
    EXPECT_EQ(stats.total_trades, 4);
    EXPECT_EQ(stats.wins, 2);
    EXPECT_EQ(stats.losses, 1);
    EXPECT_EQ(stats.break_evens, 1);
    EXPECT_NEAR(stats.win_rate, 200.0 / 3.0, 1e-9);
    EXPECT_NEAR(stats.total_pnl, 1000.0, 1e-9);
    EXPECT_NEAR(stats.gross_profit, 1500.0, 1e-9);
    EXPECT_NEAR(stats.gross_loss, -500.0, 1e-9);
    EXPECT_NEAR(stats.avg_win, 750.0, 1e-9);
    EXPECT_NEAR(stats.avg_loss, -500.0, 1e-9);
    EXPECT_NEAR(stats.expectancy, 250.0, 1e-9);
    EXPECT_NEAR(stats.profit_factor, 3.0, 1e-9);
    EXPECT_NEAR(stats.avg_duration_seconds, 12600.0 / 4.0, 1e-9);
    EXPECT_EQ(stats.r_multiple_samples, 3);
    EXPECT_NEAR(stats.avg_r_multiple, (2.0 - 1.0 + 1.0) / 3.0, 1e-9);
    EXPECT_NEAR(stats.initial_balance, 10000.0, 1e-9);
    EXPECT_NEAR(stats.gain_pct, 10.0, 1e-9);
    EXPECT_DOUBLE_EQ(stats.max_drawdown, 650.0);
}

TEST(TradeStatisticsTest, IgnoresCancelledAndOpenTrades) {
    core::AccountState account;
    account.balance = 10000.0;

    core::Trade cancelled;
    cancelled.id = "T-1";
    cancelled.status = OrderStatus::Closed;
    cancelled.close_reason = core::CloseReason::Cancelled;
    account.history.push_back(cancelled);

    core::Trade open;
    open.id = "T-2";
    open.status = OrderStatus::Open;
    open.entry_time = kT0;
    open.pnl = 120.0;
    account.history.push_back(open);

    const auto stats = trading::computeStatistics(account);
    EXPECT_EQ(stats.total_trades, 0);
    EXPECT_DOUBLE_EQ(stats.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(stats.expectancy, 0.0);
    EXPECT_DOUBLE_EQ(stats.gain_pct, 0.0);
}

TEST(TradeStatisticsTest, ProfitFactorIsZeroWithoutLosses) {
    core::AccountState account;
    account.history.push_back(closedTrade("T-1", OrderSide::Long, 1.1, 1.11, 0.0, 1000.0, 60));
    account.balance = 11000.0;
    const auto stats = trading::computeStatistics(account);
    EXPECT_DOUBLE_EQ(stats.profit_factor, 0.0);
    EXPECT_DOUBLE_EQ(stats.win_rate, 100.0);
    EXPECT_EQ(stats.r_multiple_samples, 0);
}

TEST(FormatDurationTest, Formats) {
    EXPECT_EQ(trading::formatDuration(0.0), "0s");
    EXPECT_EQ(trading::formatDuration(59.9), "59s");
    EXPECT_EQ(trading::formatDuration(3600.0), "1h");
    EXPECT_EQ(trading::formatDuration(86400.0 + 2 * 3600.0 + 3 * 60.0 + 4.0), "1d 2h 3m 4s");
}

// --- Position sizing ---

TEST(PositionSizingTest, RisksPercentOfBalance) {
    EXPECT_NEAR(trading::calculatePositionSize(10000.0, 1.0, 1.1000, 1.0950, "EURUSD"), 0.2, 1e-9);
    EXPECT_NEAR(trading::calculatePositionSize(10000.0, 1.0, 2000.0, 1990.0, "XAUUSD"), 0.1, 1e-9);
    // 0.0667 lots floors to 0.06
    EXPECT_NEAR(trading::calculatePositionSize(10000.0, 1.0, 1.1000, 1.0850, "EURUSD"), 0.06, 1e-9);
}

TEST(PositionSizingTest, ZeroForDegenerateInputs) {
    EXPECT_DOUBLE_EQ(trading::calculatePositionSize(10000.0, 1.0, 1.1, 1.1, "EURUSD"), 0.0);
    EXPECT_DOUBLE_EQ(trading::calculatePositionSize(0.0, 1.0, 1.1, 1.09, "EURUSD"), 0.0);
    EXPECT_DOUBLE_EQ(trading::calculatePositionSize(10000.0, 0.0, 1.1, 1.09, "EURUSD"), 0.0);
}

TEST(PositionSizingTest, RiskAmount) {
    EXPECT_NEAR(trading::riskAmount(0.2, 1.1000, 1.0950, "EURUSD"), 100.0, 1e-6);
}

// --- Symbols ---

TEST(SymbolsTest, ContractSizes) {
    EXPECT_DOUBLE_EQ(core::contractSizeFor("EURUSD"), 100000.0);
    EXPECT_DOUBLE_EQ(core::contractSizeFor("XAUUSD"), 100.0);
    EXPECT_DOUBLE_EQ(core::contractSizeFor("XAGUSD"), 5000.0);
    EXPECT_DOUBLE_EQ(core::contractSizeFor("CUSTOM"), 1.0);
    EXPECT_DOUBLE_EQ(core::contractSizeFor("US30"), 1.0);
}

TEST(SymbolsTest, LookupDerivesDigitsAndCurrencies) {
    const auto jpy = core::lookupSymbol("USDJPY");
    EXPECT_EQ(jpy.digits, 3);
    EXPECT_NEAR(jpy.pip_size, 0.01, 1e-12);
    EXPECT_EQ(jpy.base_currency, "USD");
    EXPECT_EQ(jpy.quote_currency, "JPY");

    const auto unknown = core::lookupSymbol("CADJPY");
    EXPECT_EQ(unknown.digits, 3);

    const auto gold = core::lookupSymbol("XAUUSD");
    EXPECT_EQ(gold.digits, 2);
    EXPECT_EQ(gold.base_currency, "XAU");

    EXPECT_EQ(core::knownSymbols().size(), 13u);
}
