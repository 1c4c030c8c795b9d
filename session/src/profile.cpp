#include "profile.hpp"
#include "utils.hpp"

namespace core {

    using json = nlohmann::json;

    void to_json(json& j, const TradeJournal& journal) {
        j = json{
            {"tags", journal.tags},
            {"confidence", journal.confidence},
            {"setup_rating", journal.setup_rating},
            {"notes", journal.notes}
        };
    }

    void from_json(const json& j, TradeJournal& journal) {
        journal.tags = j.value("tags", std::vector<std::string>{});
        journal.confidence = j.value("confidence", 0);
        journal.setup_rating = j.value("setup_rating", 0);
        journal.notes = j.value("notes", std::string());
    }

    void to_json(json& j, const Trade& trade) {
        j = json{
            {"id", trade.id},
            {"symbol", trade.symbol},
            {"side", utils::toString(trade.side)},
            {"type", utils::toString(trade.type)},
            {"entry_price", trade.entry_price},
            {"initial_stop_loss", trade.initial_stop_loss},
            {"stop_loss", trade.stop_loss},
            {"take_profit", trade.take_profit},
            {"quantity", trade.quantity},
            {"status", utils::toString(trade.status)},
            {"order_time", trade.order_time},
            {"pnl", trade.pnl}
        };
        if (trade.entry_time) j["entry_time"] = *trade.entry_time;
        if (trade.close_time) j["close_time"] = *trade.close_time;
        if (trade.close_price) j["close_price"] = *trade.close_price;
        if (trade.close_reason) j["close_reason"] = utils::toString(*trade.close_reason);
        if (trade.journal) j["journal"] = *trade.journal;
    }

    void from_json(const json& j, Trade& trade) {
        trade.id = j.at("id").get<std::string>();
        trade.symbol = j.at("symbol").get<std::string>();
        trade.side = utils::orderSideFromString(j.at("side").get<std::string>());
        trade.type = utils::orderTypeFromString(j.at("type").get<std::string>());
        trade.entry_price = j.at("entry_price").get<double>();
        trade.stop_loss = j.value("stop_loss", 0.0);
        trade.initial_stop_loss = j.value("initial_stop_loss", trade.stop_loss);
        trade.take_profit = j.value("take_profit", 0.0);
        trade.quantity = j.at("quantity").get<double>();
        trade.status = utils::orderStatusFromString(j.at("status").get<std::string>());
        trade.order_time = j.value("order_time", Timestamp{0});
        trade.pnl = j.value("pnl", 0.0);

        trade.entry_time.reset();
        trade.close_time.reset();
        trade.close_price.reset();
        trade.close_reason.reset();
        trade.journal.reset();
        if (j.contains("entry_time")) trade.entry_time = j.at("entry_time").get<Timestamp>();
        if (j.contains("close_time")) trade.close_time = j.at("close_time").get<Timestamp>();
        if (j.contains("close_price")) trade.close_price = j.at("close_price").get<double>();
        if (j.contains("close_reason")) {
            trade.close_reason = utils::closeReasonFromString(j.at("close_reason").get<std::string>());
        }
        if (j.contains("journal")) trade.journal = j.at("journal").get<TradeJournal>();
    }

    void to_json(json& j, const AccountState& account) {
        j = json{
            {"balance", account.balance},
            {"equity", account.equity},
            {"max_equity", account.max_equity},
            {"max_drawdown", account.max_drawdown},
            {"history", account.history}
        };
    }

    void from_json(const json& j, AccountState& account) {
        account.balance = j.at("balance").get<double>();
        account.equity = j.value("equity", account.balance);
        account.max_equity = j.value("max_equity", account.equity);
        account.max_drawdown = j.value("max_drawdown", 0.0);
        account.history = j.value("history", std::vector<Trade>{});
    }

} // namespace core

namespace session {

    using json = nlohmann::json;

    TraderProfile makeProfile(const std::string& id,
                              const std::string& name,
                              double balance,
                              const std::vector<std::string>& symbols,
                              core::Timestamp start_date,
                              core::Timestamp end_date,
                              core::Timeframe timeframe,
                              std::optional<int> custom_digits) {
        TraderProfile profile;
        profile.id = id;
        profile.name = name;
        profile.initial_balance = balance;
        profile.account.balance = balance;
        profile.account.equity = balance;
        profile.account.max_equity = balance;
        profile.selected_symbols = symbols;
        profile.active_symbol = symbols.empty() ? std::string() : symbols.front();
        profile.active_timeframe = timeframe;
        profile.start_date = start_date;
        profile.end_date = end_date;
        profile.current_sim_time = start_date;
        profile.custom_digits = custom_digits;
        return profile;
    }

    void to_json(json& j, const LotSizeSettings& settings) {
        j = json{{"show", settings.show}, {"risk_percent", settings.risk_percent}};
    }

    void from_json(const json& j, LotSizeSettings& settings) {
        settings.show = j.value("show", settings.show);
        settings.risk_percent = j.value("risk_percent", settings.risk_percent);
    }

    void to_json(json& j, const TraderProfile& profile) {
        j = json{
            {"id", profile.id},
            {"name", profile.name},
            {"created_at", profile.created_at},
            {"last_played", profile.last_played},
            {"time_played", profile.time_played},
            {"initial_balance", profile.initial_balance},
            {"account", profile.account},
            {"active_symbol", profile.active_symbol},
            {"active_timeframe", core::utils::timeframeToString(profile.active_timeframe)},
            {"current_sim_time", profile.current_sim_time},
            {"selected_symbols", profile.selected_symbols},
            {"start_date", profile.start_date},
            {"end_date", profile.end_date},
            {"drawings", profile.drawings},
            {"lot_size", profile.lot_size}
        };
        if (profile.custom_digits) j["custom_digits"] = *profile.custom_digits;
    }

    void from_json(const json& j, TraderProfile& profile) {
        profile.id = j.at("id").get<std::string>();
        profile.name = j.value("name", profile.id);
        profile.created_at = j.value("created_at", core::Timestamp{0});
        profile.last_played = j.value("last_played", core::Timestamp{0});
        profile.time_played = j.value("time_played", 0LL);
        profile.account = j.at("account").get<core::AccountState>();
        profile.initial_balance = j.value("initial_balance", profile.account.balance);
        profile.active_symbol = j.value("active_symbol", std::string());
        profile.active_timeframe = core::utils::timeframeFromString(j.value("active_timeframe", std::string("H1")));
        profile.current_sim_time = j.value("current_sim_time", core::Timestamp{0});
        profile.selected_symbols = j.value("selected_symbols", std::vector<std::string>{});
        profile.start_date = j.value("start_date", core::Timestamp{0});
        profile.end_date = j.value("end_date", core::Timestamp{0});
        profile.drawings = j.value("drawings", json::array());
        profile.custom_digits.reset();
        if (j.contains("custom_digits") && !j.at("custom_digits").is_null()) {
            profile.custom_digits = j.at("custom_digits").get<int>();
        }
        if (j.contains("lot_size")) profile.lot_size = j.at("lot_size").get<LotSizeSettings>();
    }

} // namespace session
