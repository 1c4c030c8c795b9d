#pragma once

#include "datatypes.hpp"
#include "currency_converter.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trading {

    enum class RejectReason {
        None,
        AccountBlown,
        InvalidQuantity,
        InvalidPrice,
        WrongSideOfMarket,
        InvalidStopLoss,
        InvalidTakeProfit,
        InsufficientMargin,
        UnknownTrade,
        InvalidState
    };

    std::string toString(RejectReason reason);

    struct OrderRequest {
        core::OrderSide side = core::OrderSide::Long;
        core::OrderType type = core::OrderType::Market;
        double entry_price = 0.0; // Ignored for market orders
        double stop_loss = 0.0;
        double take_profit = 0.0;
        double quantity = 0.0;
    };

    // What the engine needs to know about the replay at the moment of a call
    struct MarketContext {
        std::string active_symbol;
        double price = 0.0;            // Current tradable price, 0 when unknown
        core::Timestamp sim_time = 0;
    };

    struct OrderResult {
        bool accepted = false;
        RejectReason reason = RejectReason::None;
        std::string message;
        std::string trade_id;

        static OrderResult ok(const std::string& trade_id);
        static OrderResult reject(RejectReason reason, const std::string& message);
    };

    struct TickReport {
        bool stopped_out = false;
        double margin_level = 0.0;
        std::vector<std::string> closed_ids;    // SL/TP exits and liquidations
        std::vector<std::string> triggered_ids; // Pending orders that became OPEN
    };

    // Margin level reported when no margin is in use
    constexpr double kNoMarginLevel = 999999.0;

    // Owns the AccountState and drives every trade through
    // PENDING -> OPEN -> CLOSED. Not internally synchronized.
    class OrderEngine {
    public:
        OrderEngine(double initial_balance,
                    std::shared_ptr<const ICurrencyConverter> converter,
                    double stop_out_level = 0.0);

        // --- Commands ---
        OrderResult placeOrder(const OrderRequest& request, const MarketContext& market);
        OrderResult closeOrder(const std::string& trade_id,
                               const MarketContext& market,
                               std::optional<double> exit_price = std::nullopt);
        OrderResult modifyTrade(const std::string& trade_id, double stop_loss, double take_profit,
                                const MarketContext& market);
        OrderResult modifyPendingEntry(const std::string& trade_id, double entry_price,
                                       const MarketContext& market);
        OrderResult annotateTrade(const std::string& trade_id, const core::TradeJournal& journal);

        // Revaluation, stop-out, equity bookkeeping, SL/TP and pending triggers for one bar
        TickReport onTick(const core::Candle& bar, const MarketContext& market);

        // --- Account queries ---
        const core::AccountState& account() const { return account_; }
        double usedMargin() const;
        double freeMargin() const { return account_.equity - usedMargin(); }
        double marginLevel() const;
        bool isBlown() const { return account_.equity <= 0.0; }
        double initialBalance() const { return initial_balance_; }

        const core::Trade* findTrade(const std::string& trade_id) const;
        std::vector<core::Trade> openTrades() const;
        std::vector<core::Trade> pendingTrades() const;

        // Replaces the account, e.g. from a stored profile
        void restore(const core::AccountState& account, double initial_balance);
        void reset(double initial_balance);

    private:
        core::Trade* findMutable(const std::string& trade_id);
        double floatingPnl(const core::Trade& trade, double price) const;
        double requiredMargin(const core::Trade& trade) const;
        void realize(core::Trade& trade, double exit_price, core::Timestamp time, core::CloseReason reason);
        void updateHighWater();
        OrderResult validateStops(core::OrderSide side, double reference, double stop_loss, double take_profit) const;
        std::string nextTradeId();

        double initial_balance_;
        std::shared_ptr<const ICurrencyConverter> converter_;
        double stop_out_level_;
        core::AccountState account_;
        unsigned long long next_id_ = 0;
    };

} // namespace trading
