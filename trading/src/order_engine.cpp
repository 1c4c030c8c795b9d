#include "order_engine.hpp"
#include "logging.hpp"
#include "symbols.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <stdexcept>

namespace trading {

    namespace {
        constexpr const char* kTradeIdPrefix = "T-";

        double direction(core::OrderSide side) {
            return side == core::OrderSide::Long ? 1.0 : -1.0;
        }
    }

    std::string toString(RejectReason reason) {
        switch (reason) {
            case RejectReason::None:               return "NONE";
            case RejectReason::AccountBlown:       return "ACCOUNT_BLOWN";
            case RejectReason::InvalidQuantity:    return "INVALID_QUANTITY";
            case RejectReason::InvalidPrice:       return "INVALID_PRICE";
            case RejectReason::WrongSideOfMarket:  return "WRONG_SIDE_OF_MARKET";
            case RejectReason::InvalidStopLoss:    return "INVALID_STOP_LOSS";
            case RejectReason::InvalidTakeProfit:  return "INVALID_TAKE_PROFIT";
            case RejectReason::InsufficientMargin: return "INSUFFICIENT_MARGIN";
            case RejectReason::UnknownTrade:       return "UNKNOWN_TRADE";
            case RejectReason::InvalidState:       return "INVALID_STATE";
        }
        return "NONE";
    }

    OrderResult OrderResult::ok(const std::string& trade_id) {
        OrderResult result;
        result.accepted = true;
        result.trade_id = trade_id;
        return result;
    }

    OrderResult OrderResult::reject(RejectReason reason, const std::string& message) {
        core::logging::getLogger()->warn("Order command rejected ({}): {}", toString(reason), message);
        OrderResult result;
        result.reason = reason;
        result.message = message;
        return result;
    }

    OrderEngine::OrderEngine(double initial_balance,
                             std::shared_ptr<const ICurrencyConverter> converter,
                             double stop_out_level)
        : initial_balance_(initial_balance),
          converter_(std::move(converter)),
          stop_out_level_(stop_out_level)
    {
        if (initial_balance <= 0.0) {
            throw std::invalid_argument("Initial balance must be positive.");
        }
        if (!converter_) {
            throw std::invalid_argument("OrderEngine requires a currency converter.");
        }
        reset(initial_balance);
    }

    void OrderEngine::reset(double initial_balance) {
        initial_balance_ = initial_balance;
        account_ = core::AccountState{};
        account_.balance = initial_balance;
        account_.equity = initial_balance;
        account_.max_equity = initial_balance;
        next_id_ = 0;
    }

    void OrderEngine::restore(const core::AccountState& account, double initial_balance) {
        initial_balance_ = initial_balance;
        account_ = account;
        next_id_ = 0;
        for (const auto& trade : account_.history) {
            if (!core::utils::startsWith(trade.id, kTradeIdPrefix)) continue;
            const unsigned long long n = std::strtoull(trade.id.c_str() + 2, nullptr, 10);
            next_id_ = std::max(next_id_, n);
        }
        core::logging::getLogger()->info("Account restored: balance={:.2f}, equity={:.2f}, trades={}",
                                         account_.balance, account_.equity, account_.history.size());
    }

    std::string OrderEngine::nextTradeId() {
        return kTradeIdPrefix + std::to_string(++next_id_);
    }

    // --- Helpers ---

    core::Trade* OrderEngine::findMutable(const std::string& trade_id) {
        auto it = std::find_if(account_.history.begin(), account_.history.end(),
                               [&](const core::Trade& t) { return t.id == trade_id; });
        return it != account_.history.end() ? &(*it) : nullptr;
    }

    const core::Trade* OrderEngine::findTrade(const std::string& trade_id) const {
        auto it = std::find_if(account_.history.begin(), account_.history.end(),
                               [&](const core::Trade& t) { return t.id == trade_id; });
        return it != account_.history.end() ? &(*it) : nullptr;
    }

    std::vector<core::Trade> OrderEngine::openTrades() const {
        std::vector<core::Trade> result;
        std::copy_if(account_.history.begin(), account_.history.end(), std::back_inserter(result),
                     [](const core::Trade& t) { return t.status == core::OrderStatus::Open; });
        return result;
    }

    std::vector<core::Trade> OrderEngine::pendingTrades() const {
        std::vector<core::Trade> result;
        std::copy_if(account_.history.begin(), account_.history.end(), std::back_inserter(result),
                     [](const core::Trade& t) { return t.status == core::OrderStatus::Pending; });
        return result;
    }

    double OrderEngine::floatingPnl(const core::Trade& trade, double price) const {
        const double raw = (price - trade.entry_price) * trade.quantity
                           * core::contractSizeFor(trade.symbol) * direction(trade.side);
        return converter_->convertToAccountCurrency(trade.symbol, raw, price);
    }

    double OrderEngine::requiredMargin(const core::Trade& trade) const {
        return converter_->requiredMargin(trade.symbol, trade.quantity, trade.entry_price);
    }

    double OrderEngine::usedMargin() const {
        double used = 0.0;
        for (const auto& trade : account_.history) {
            if (trade.status == core::OrderStatus::Open) {
                used += requiredMargin(trade);
            }
        }
        return used;
    }

    double OrderEngine::marginLevel() const {
        const double used = usedMargin();
        return used > 0.0 ? account_.equity / used * 100.0 : kNoMarginLevel;
    }

    void OrderEngine::updateHighWater() {
        account_.max_equity = std::max(account_.max_equity, account_.equity);
        account_.max_drawdown = std::max(account_.max_drawdown, account_.max_equity - account_.equity);
    }

    // Long: SL < reference < TP. Short: TP < reference < SL. Zero means unset.
    OrderResult OrderEngine::validateStops(core::OrderSide side, double reference,
                                           double stop_loss, double take_profit) const {
        if (stop_loss < 0.0) {
            return OrderResult::reject(RejectReason::InvalidStopLoss, "Stop loss cannot be negative.");
        }
        if (take_profit < 0.0) {
            return OrderResult::reject(RejectReason::InvalidTakeProfit, "Take profit cannot be negative.");
        }
        const bool is_long = side == core::OrderSide::Long;
        if (stop_loss > 0.0 && (is_long ? stop_loss >= reference : stop_loss <= reference)) {
            return OrderResult::reject(RejectReason::InvalidStopLoss,
                                       is_long ? "Stop loss must be below the entry price for a long."
                                               : "Stop loss must be above the entry price for a short.");
        }
        if (take_profit > 0.0 && (is_long ? take_profit <= reference : take_profit >= reference)) {
            return OrderResult::reject(RejectReason::InvalidTakeProfit,
                                       is_long ? "Take profit must be above the entry price for a long."
                                               : "Take profit must be below the entry price for a short.");
        }
        return OrderResult::ok("");
    }

    // --- Commands ---

    OrderResult OrderEngine::placeOrder(const OrderRequest& request, const MarketContext& market) {
        auto logger = core::logging::getLogger();

        if (account_.equity <= 0.0) {
            return OrderResult::reject(RejectReason::AccountBlown, "Account is blown (equity is zero); reset the profile.");
        }
        if (!(request.quantity > 0.0)) {
            return OrderResult::reject(RejectReason::InvalidQuantity, "Quantity must be positive.");
        }

        const bool is_market = request.type == core::OrderType::Market;
        const double execution_price = is_market ? market.price : request.entry_price;
        if (!(execution_price > 0.0)) {
            return OrderResult::reject(RejectReason::InvalidPrice, "Execution price is not valid.");
        }

        if (!is_market) {
            if (!(market.price > 0.0)) {
                return OrderResult::reject(RejectReason::InvalidPrice, "No market price to place a pending order against.");
            }
            const bool is_long = request.side == core::OrderSide::Long;
            const bool is_limit = request.type == core::OrderType::Limit;
            // Buy Limit / Sell Stop rest below market, Buy Stop / Sell Limit above
            const bool must_be_below = (is_long && is_limit) || (!is_long && !is_limit);
            if (must_be_below ? execution_price >= market.price : execution_price <= market.price) {
                return OrderResult::reject(RejectReason::WrongSideOfMarket,
                                           fmt::format("{} {} at {:.5f} must be {} market {:.5f}.",
                                                       is_long ? "Buy" : "Sell",
                                                       is_limit ? "Limit" : "Stop",
                                                       execution_price,
                                                       must_be_below ? "below" : "above",
                                                       market.price));
            }
        }

        auto stops = validateStops(request.side, execution_price, request.stop_loss, request.take_profit);
        if (!stops.accepted) return stops;

        const double required = converter_->requiredMargin(market.active_symbol, request.quantity, execution_price);
        const double free_margin = freeMargin();
        if (required > free_margin) {
            return OrderResult::reject(RejectReason::InsufficientMargin,
                                       fmt::format("Insufficient margin: required {:.2f}, free {:.2f}.",
                                                   required, free_margin));
        }

        core::Trade trade;
        trade.id = nextTradeId();
        trade.symbol = market.active_symbol;
        trade.side = request.side;
        trade.type = request.type;
        trade.entry_price = execution_price;
        trade.initial_stop_loss = request.stop_loss;
        trade.stop_loss = request.stop_loss;
        trade.take_profit = request.take_profit;
        trade.quantity = request.quantity;
        trade.order_time = market.sim_time;
        trade.status = is_market ? core::OrderStatus::Open : core::OrderStatus::Pending;
        if (is_market) {
            trade.entry_time = market.sim_time;
        }
        account_.history.push_back(trade);

        logger->info("Order {} placed: {} {} {} {:.2f} lots @ {:.5f} (SL {:.5f}, TP {:.5f}) -> {}",
                     trade.id, trade.symbol, core::utils::toString(trade.side), core::utils::toString(trade.type),
                     trade.quantity, trade.entry_price, trade.stop_loss, trade.take_profit,
                     core::utils::toString(trade.status));
        return OrderResult::ok(trade.id);
    }

    void OrderEngine::realize(core::Trade& trade, double exit_price, core::Timestamp time, core::CloseReason reason) {
        const double previous_floating = trade.pnl;
        const double realized = floatingPnl(trade, exit_price);

        trade.status = core::OrderStatus::Closed;
        trade.close_price = exit_price;
        trade.close_time = time;
        trade.close_reason = reason;
        trade.pnl = realized;

        account_.balance += realized;
        account_.equity += realized - previous_floating;
        updateHighWater();

        core::logging::getLogger()->info("Trade {} closed ({}) @ {:.5f}, PnL {:.2f}, balance {:.2f}",
                                         trade.id, core::utils::toString(reason), exit_price, realized,
                                         account_.balance);
    }

    OrderResult OrderEngine::closeOrder(const std::string& trade_id,
                                        const MarketContext& market,
                                        std::optional<double> exit_price) {
        core::Trade* trade = findMutable(trade_id);
        if (!trade) {
            return OrderResult::reject(RejectReason::UnknownTrade, "No trade with id " + trade_id + ".");
        }

        if (trade->status == core::OrderStatus::Pending) {
            trade->status = core::OrderStatus::Closed;
            trade->close_time = market.sim_time;
            trade->close_reason = core::CloseReason::Cancelled;
            trade->pnl = 0.0;
            core::logging::getLogger()->info("Pending order {} cancelled", trade->id);
            return OrderResult::ok(trade->id);
        }
        if (trade->status != core::OrderStatus::Open) {
            return OrderResult::reject(RejectReason::InvalidState, "Trade " + trade_id + " is already closed.");
        }

        double price = trade->entry_price; // Inactive symbols freeze at entry
        if (exit_price) {
            price = *exit_price;
        } else if (trade->symbol == market.active_symbol && market.price > 0.0) {
            price = market.price;
        }
        if (!(price > 0.0)) {
            return OrderResult::reject(RejectReason::InvalidPrice, "Exit price is not valid.");
        }

        realize(*trade, price, market.sim_time, core::CloseReason::Manual);
        return OrderResult::ok(trade->id);
    }

    OrderResult OrderEngine::modifyTrade(const std::string& trade_id, double stop_loss, double take_profit,
                                         const MarketContext& market) {
        core::Trade* trade = findMutable(trade_id);
        if (!trade) {
            return OrderResult::reject(RejectReason::UnknownTrade, "No trade with id " + trade_id + ".");
        }
        if (trade->status == core::OrderStatus::Closed) {
            return OrderResult::reject(RejectReason::InvalidState, "Closed trades cannot be modified.");
        }

        if (trade->status == core::OrderStatus::Pending) {
            auto stops = validateStops(trade->side, trade->entry_price, stop_loss, take_profit);
            if (!stops.accepted) return stops;
        } else if (trade->symbol == market.active_symbol && market.price > 0.0) {
            // Open trades may trail their stop past entry, so check against the market
            auto stops = validateStops(trade->side, market.price, stop_loss, take_profit);
            if (!stops.accepted) return stops;
        } else if (stop_loss < 0.0 || take_profit < 0.0) {
            return OrderResult::reject(RejectReason::InvalidStopLoss, "Stop levels cannot be negative.");
        }

        trade->stop_loss = stop_loss;
        trade->take_profit = take_profit;
        core::logging::getLogger()->info("Trade {} modified: SL {:.5f}, TP {:.5f}", trade->id, stop_loss, take_profit);
        return OrderResult::ok(trade->id);
    }

    OrderResult OrderEngine::modifyPendingEntry(const std::string& trade_id, double entry_price,
                                                const MarketContext& market) {
        core::Trade* trade = findMutable(trade_id);
        if (!trade) {
            return OrderResult::reject(RejectReason::UnknownTrade, "No trade with id " + trade_id + ".");
        }
        if (trade->status != core::OrderStatus::Pending) {
            return OrderResult::reject(RejectReason::InvalidState, "Only pending orders can change their entry.");
        }
        if (!(entry_price > 0.0)) {
            return OrderResult::reject(RejectReason::InvalidPrice, "Entry price must be positive.");
        }
        if (trade->symbol == market.active_symbol && market.price > 0.0) {
            const bool is_long = trade->side == core::OrderSide::Long;
            const bool is_limit = trade->type == core::OrderType::Limit;
            const bool must_be_below = (is_long && is_limit) || (!is_long && !is_limit);
            if (must_be_below ? entry_price >= market.price : entry_price <= market.price) {
                return OrderResult::reject(RejectReason::WrongSideOfMarket, "New entry is on the wrong side of the market.");
            }
        }
        auto stops = validateStops(trade->side, entry_price, trade->stop_loss, trade->take_profit);
        if (!stops.accepted) return stops;

        trade->entry_price = entry_price;
        core::logging::getLogger()->info("Pending order {} entry moved to {:.5f}", trade->id, entry_price);
        return OrderResult::ok(trade->id);
    }

    OrderResult OrderEngine::annotateTrade(const std::string& trade_id, const core::TradeJournal& journal) {
        core::Trade* trade = findMutable(trade_id);
        if (!trade) {
            return OrderResult::reject(RejectReason::UnknownTrade, "No trade with id " + trade_id + ".");
        }
        trade->journal = journal;
        return OrderResult::ok(trade->id);
    }

    // --- Per-tick evaluation ---

    TickReport OrderEngine::onTick(const core::Candle& bar, const MarketContext& market) {
        auto logger = core::logging::getLogger();
        TickReport report;

        // 1. Revaluation
        if (market.price > 0.0) {
            for (auto& trade : account_.history) {
                if (trade.status == core::OrderStatus::Open && trade.symbol == market.active_symbol) {
                    trade.pnl = floatingPnl(trade, market.price);
                }
            }
        }

        // Worst case: active positions valued at the bar's adverse extreme
        double floating = 0.0;
        double worst_floating = 0.0;
        bool has_open = false;
        for (const auto& trade : account_.history) {
            if (trade.status != core::OrderStatus::Open) continue;
            has_open = true;
            floating += trade.pnl;
            const double adverse = trade.side == core::OrderSide::Long ? bar.low : bar.high;
            if (trade.symbol == market.active_symbol && adverse > 0.0) {
                worst_floating += std::min(trade.pnl, floatingPnl(trade, adverse));
            } else {
                worst_floating += trade.pnl;
            }
        }
        const double equity = account_.balance + floating;
        const double worst_equity = account_.balance + worst_floating;
        const double used = usedMargin();
        report.margin_level = used > 0.0 ? equity / used * 100.0 : kNoMarginLevel;
        const double worst_level = used > 0.0 ? worst_equity / used * 100.0 : kNoMarginLevel;

        // 2. Stop-out, closing at the current price
        if (has_open && (worst_equity <= 0.0 || worst_level <= stop_out_level_)) {
            logger->warn("STOP OUT: equity={:.2f} (intrabar low point {:.2f}), margin level={:.2f}%",
                         equity, worst_equity, worst_level);
            for (auto& trade : account_.history) {
                if (trade.status != core::OrderStatus::Open) continue;
                const bool active = trade.symbol == market.active_symbol && market.price > 0.0;
                trade.status = core::OrderStatus::Closed;
                trade.close_price = active ? market.price : trade.entry_price;
                trade.close_time = market.sim_time;
                trade.close_reason = core::CloseReason::StopOut;
                report.closed_ids.push_back(trade.id);
            }
            const double clamped = std::max(0.0, equity);
            account_.balance = clamped;
            account_.equity = clamped;
            updateHighWater();
            report.stopped_out = true;
            return report;
        }

        // 3. Equity bookkeeping
        account_.equity = equity;
        updateHighWater();

        // 4. Stop loss / take profit, stop first when a bar touches both
        for (auto& trade : account_.history) {
            if (trade.status != core::OrderStatus::Open || trade.symbol != market.active_symbol) continue;
            if (trade.side == core::OrderSide::Long) {
                if (trade.stop_loss > 0.0 && bar.low <= trade.stop_loss) {
                    realize(trade, trade.stop_loss, market.sim_time, core::CloseReason::StopLoss);
                    report.closed_ids.push_back(trade.id);
                } else if (trade.take_profit > 0.0 && bar.high >= trade.take_profit) {
                    realize(trade, trade.take_profit, market.sim_time, core::CloseReason::TakeProfit);
                    report.closed_ids.push_back(trade.id);
                }
            } else {
                if (trade.stop_loss > 0.0 && bar.high >= trade.stop_loss) {
                    realize(trade, trade.stop_loss, market.sim_time, core::CloseReason::StopLoss);
                    report.closed_ids.push_back(trade.id);
                } else if (trade.take_profit > 0.0 && bar.low <= trade.take_profit) {
                    realize(trade, trade.take_profit, market.sim_time, core::CloseReason::TakeProfit);
                    report.closed_ids.push_back(trade.id);
                }
            }
        }

        // 5. Pending triggers
        for (auto& trade : account_.history) {
            if (trade.status != core::OrderStatus::Pending || trade.symbol != market.active_symbol) continue;
            const bool hit_high = bar.high >= trade.entry_price;
            const bool hit_low = bar.low <= trade.entry_price;
            const bool is_limit = trade.type == core::OrderType::Limit;
            bool triggered = false;
            if (trade.side == core::OrderSide::Long) {
                triggered = is_limit ? hit_low : hit_high;
            } else {
                triggered = is_limit ? hit_high : hit_low;
            }
            if (triggered) {
                trade.status = core::OrderStatus::Open;
                trade.entry_time = bar.time;
                trade.pnl = 0.0;
                report.triggered_ids.push_back(trade.id);
                logger->info("Pending order {} triggered @ {:.5f} on bar {}", trade.id, trade.entry_price,
                             core::utils::timestampToString(bar.time));
            }
        }

        return report;
    }

} // namespace trading
