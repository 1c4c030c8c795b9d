#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include <sqlite3.h>

#include "datatypes.hpp"

namespace data {

// Stored profile row: the payload is the profile's JSON document
struct ProfileRecord {
    std::string id;
    std::string name;
    core::Timestamp updated_at = 0;
    std::string payload;
};

// SQLite store for candles (`market_data`) and trader profiles (`profiles`).
// All public methods are serialized by an internal mutex.
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();

    bool initializeSchema();

    // --- Candles ---
    // INSERT OR IGNORE on (symbol, tf, time); returns false on SQL errors
    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const std::string& symbol,
                     core::Timeframe tf);

    // Inclusive range, ascending
    core::TimeSeries<core::Candle> queryCandles(const std::string& symbol,
                                                core::Timeframe tf,
                                                core::Timestamp start_time,
                                                core::Timestamp end_time);

    // Newest `limit` bars with time < before, returned ascending
    core::TimeSeries<core::Candle> queryBefore(const std::string& symbol,
                                               core::Timeframe tf,
                                               core::Timestamp before,
                                               std::size_t limit);

    // Oldest `limit` bars with time > after
    core::TimeSeries<core::Candle> queryAfter(const std::string& symbol,
                                              core::Timeframe tf,
                                              core::Timestamp after,
                                              std::size_t limit);

    // Earliest (or latest) bar; without a timeframe across all timeframes
    std::optional<core::Candle> queryBoundary(const std::string& symbol,
                                              std::optional<core::Timeframe> tf,
                                              bool earliest);

    // --- Profiles ---
    bool saveProfile(const ProfileRecord& record);
    std::optional<ProfileRecord> loadProfile(const std::string& id);
    std::vector<ProfileRecord> listProfiles(); // Payload left empty, newest first
    bool deleteProfile(const std::string& id);

private:
    bool executeLocked(const std::string& sql);
    core::TimeSeries<core::Candle> runCandleQuery(const char* sql,
                                                  const std::string& symbol,
                                                  const std::string& tf_label,
                                                  core::Timestamp a,
                                                  long long b);

    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
    mutable std::mutex mutex_;
};

} // namespace data
