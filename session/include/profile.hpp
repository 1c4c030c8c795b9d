#pragma once

#include "datatypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace session {

    struct LotSizeSettings {
        bool show = true;
        double risk_percent = 1.0;
    };

    // Everything needed to resume a replay where the trader left it
    struct TraderProfile {
        std::string id;
        std::string name;
        core::Timestamp created_at = 0;
        core::Timestamp last_played = 0;
        long long time_played = 0; // Wall-clock seconds spent in the session

        double initial_balance = 10000.0;
        core::AccountState account;
        std::string active_symbol;
        core::Timeframe active_timeframe = core::Timeframe::H1;
        core::Timestamp current_sim_time = 0;

        std::vector<std::string> selected_symbols;
        core::Timestamp start_date = 0;
        core::Timestamp end_date = 0;

        nlohmann::json drawings = nlohmann::json::array(); // Opaque to the engine
        std::optional<int> custom_digits;
        LotSizeSettings lot_size;
    };

    // Fresh profile with a funded account, positioned at start_date
    TraderProfile makeProfile(const std::string& id,
                              const std::string& name,
                              double balance,
                              const std::vector<std::string>& symbols,
                              core::Timestamp start_date,
                              core::Timestamp end_date,
                              core::Timeframe timeframe = core::Timeframe::H1,
                              std::optional<int> custom_digits = std::nullopt);

    void to_json(nlohmann::json& j, const LotSizeSettings& settings);
    void from_json(const nlohmann::json& j, LotSizeSettings& settings);
    void to_json(nlohmann::json& j, const TraderProfile& profile);
    void from_json(const nlohmann::json& j, TraderProfile& profile);

} // namespace session

namespace core {

    // Serialization of the shared data model, found through ADL
    void to_json(nlohmann::json& j, const TradeJournal& journal);
    void from_json(const nlohmann::json& j, TradeJournal& journal);
    void to_json(nlohmann::json& j, const Trade& trade);
    void from_json(const nlohmann::json& j, Trade& trade);
    void to_json(nlohmann::json& j, const AccountState& account);
    void from_json(const nlohmann::json& j, AccountState& account);

} // namespace core
