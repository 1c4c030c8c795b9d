#include "trade_statistics.hpp"
#include "logging.hpp"
#include <cmath>
#include <vector>

namespace trading {

    TradeStatistics computeStatistics(const core::AccountState& account) {
        TradeStatistics stats;
        double total_duration = 0.0;
        double total_r = 0.0;

        for (const auto& trade : account.history) {
            if (trade.status != core::OrderStatus::Closed || !trade.entry_time) continue;

            ++stats.total_trades;
            stats.total_pnl += trade.pnl;
            if (trade.pnl > 0.0) {
                ++stats.wins;
                stats.gross_profit += trade.pnl;
            } else if (trade.pnl < 0.0) {
                ++stats.losses;
                stats.gross_loss += trade.pnl;
            } else {
                ++stats.break_evens;
            }

            if (trade.close_time) {
                total_duration += static_cast<double>(*trade.close_time - *trade.entry_time);
            }

            // R-multiple: price move over initial risk distance
            if (trade.pnl == 0.0 || !trade.close_price) continue;
            const double stop = trade.initial_stop_loss > 0.0 ? trade.initial_stop_loss : trade.stop_loss;
            const double risk = stop > 0.0 ? std::abs(trade.entry_price - stop) : 0.0;
            if (risk > 0.0) {
                double move = *trade.close_price - trade.entry_price;
                if (trade.side == core::OrderSide::Short) move = -move;
                total_r += move / risk;
                ++stats.r_multiple_samples;
            }
        }

        const int decisive = stats.wins + stats.losses;
        stats.win_rate = decisive > 0 ? static_cast<double>(stats.wins) / decisive * 100.0 : 0.0;
        stats.avg_win = stats.wins > 0 ? stats.gross_profit / stats.wins : 0.0;
        stats.avg_loss = stats.losses > 0 ? stats.gross_loss / stats.losses : 0.0;
        stats.expectancy = stats.total_trades > 0 ? stats.total_pnl / stats.total_trades : 0.0;
        stats.avg_duration_seconds = stats.total_trades > 0 ? total_duration / stats.total_trades : 0.0;
        stats.avg_r_multiple = stats.r_multiple_samples > 0 ? total_r / stats.r_multiple_samples : 0.0;
        stats.profit_factor = stats.gross_loss < 0.0 ? stats.gross_profit / std::abs(stats.gross_loss) : 0.0;

        stats.initial_balance = account.balance - stats.total_pnl;
        stats.gain_pct = stats.initial_balance != 0.0
            ? (account.balance - stats.initial_balance) / stats.initial_balance * 100.0
            : 0.0;
        stats.max_drawdown = account.max_drawdown;
        return stats;
    }

    std::string formatDuration(double seconds) {
        const long long total = static_cast<long long>(std::floor(std::abs(seconds)));
        const long long days = total / 86400;
        const long long hours = (total % 86400) / 3600;
        const long long minutes = (total % 3600) / 60;
        const long long secs = total % 60;

        std::vector<std::string> parts;
        if (days > 0) parts.push_back(std::to_string(days) + "d");
        if (hours > 0) parts.push_back(std::to_string(hours) + "h");
        if (minutes > 0) parts.push_back(std::to_string(minutes) + "m");
        if (secs > 0 || parts.empty()) parts.push_back(std::to_string(secs) + "s");

        std::string result;
        for (const auto& part : parts) {
            if (!result.empty()) result += ' ';
            result += part;
        }
        return result;
    }

    void TradeStatistics::logMetrics() const {
        auto logger = core::logging::getLogger();
        logger->info("--- Session Statistics ---");
        logger->info("Trades: {} (W {} / L {} / BE {})", total_trades, wins, losses, break_evens);
        logger->info("Win Rate: {:.2f}%", win_rate);
        logger->info("Total PnL: {:.2f}", total_pnl);
        logger->info("Avg Win: {:.2f}  Avg Loss: {:.2f}", avg_win, avg_loss);
        logger->info("Expectancy: {:.2f}", expectancy);
        logger->info("Profit Factor: {:.2f}", profit_factor);
        logger->info("Avg Duration: {}", formatDuration(avg_duration_seconds));
        logger->info("Avg R: {:.2f} ({} samples)", avg_r_multiple, r_multiple_samples);
        logger->info("Initial Balance: {:.2f}  Gain: {:.2f}%", initial_balance, gain_pct);
        logger->info("Max Drawdown: {:.2f}", max_drawdown);
        logger->info("--------------------------");
    }

} // namespace trading
