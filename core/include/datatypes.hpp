#pragma once // Use #pragma once for include guards (common practice)

#include <cstdint>
#include <string>
#include <vector>
#include <optional> // For fields that only exist after a state transition

namespace core {

    // Unix time in whole seconds. Candle times are bar-open times.
    using Timestamp = std::int64_t;

    struct Candle {
        Timestamp time = 0;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0;
        // Fabricated warmup padding, never real market history
        bool synthetic = false;

        bool operator<(const Candle& other) const {
            return time < other.time;
        }
    };

    enum class Timeframe {
        M2,
        M5,
        M15,
        M30,
        H1,
        H2,
        H4,
        D1
    };

    enum class OrderSide {
        Long,
        Short
    };

    enum class OrderType {
        Market,
        Limit,
        Stop
    };

    // PENDING -> OPEN -> CLOSED, or PENDING -> CLOSED on cancel
    enum class OrderStatus {
        Pending,
        Open,
        Closed
    };

    enum class CloseReason {
        Manual,
        StopLoss,
        TakeProfit,
        StopOut,
        Cancelled
    };

    // Trader's notes on a trade. Never affects financial fields.
    struct TradeJournal {
        std::vector<std::string> tags;
        int confidence = 0;    // 1-5
        int setup_rating = 0;  // 1-5
        std::string notes;
    };

    struct Trade {
        std::string id;
        std::string symbol;
        OrderSide side = OrderSide::Long;
        OrderType type = OrderType::Market;
        double entry_price = 0.0;
        double initial_stop_loss = 0.0; // For R-multiple statistics
        double stop_loss = 0.0;         // 0 = not set
        double take_profit = 0.0;       // 0 = not set
        double quantity = 0.0;          // Lots
        OrderStatus status = OrderStatus::Pending;
        Timestamp order_time = 0;
        std::optional<Timestamp> entry_time;
        std::optional<Timestamp> close_time;
        std::optional<double> close_price;
        double pnl = 0.0;               // Floating while OPEN, realized once CLOSED
        std::optional<CloseReason> close_reason;
        std::optional<TradeJournal> journal;
    };

    struct AccountState {
        double balance = 0.0;
        double equity = 0.0;
        double max_equity = 0.0;   // High-water mark for drawdown
        double max_drawdown = 0.0; // In account currency
        std::vector<Trade> history;
    };

    struct SimulationState {
        bool is_playing = false;
        int speed = 500;            // Milliseconds per tick
        std::size_t current_index = 0;
        std::size_t max_index = 0;  // Length of the visible buffer
    };

    struct IndicatorPoint {
        Timestamp time = 0;
        double value = 0.0;
    };

    struct MacdPoint {
        Timestamp time = 0;
        double macd = 0.0;
        double signal = 0.0;
        double histogram = 0.0;
    };

    // Basic TimeSeries concept
    template<typename T>
    using TimeSeries = std::vector<T>;

} // namespace core
