#pragma once

#include "datatypes.hpp"
#include <string>

namespace trading {

    // Performance summary over closed trades that actually entered the market.
    // Cancelled pending orders never count.
    struct TradeStatistics {
        int total_trades = 0;
        int wins = 0;
        int losses = 0;
        int break_evens = 0;
        double win_rate = 0.0;          // Percent of decisive (non break-even) trades
        double total_pnl = 0.0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;        // Negative or zero
        double avg_win = 0.0;
        double avg_loss = 0.0;          // Negative or zero
        double expectancy = 0.0;        // Mean PnL per trade
        double profit_factor = 0.0;     // gross_profit / |gross_loss|, 0 without losses
        double avg_duration_seconds = 0.0;
        double avg_r_multiple = 0.0;
        int r_multiple_samples = 0;
        double initial_balance = 0.0;   // Balance before the counted trades
        double gain_pct = 0.0;
        double max_drawdown = 0.0;

        void logMetrics() const;
    };

    TradeStatistics computeStatistics(const core::AccountState& account);

    // Human readable "1d 2h 3m 4s"
    std::string formatDuration(double seconds);

} // namespace trading
