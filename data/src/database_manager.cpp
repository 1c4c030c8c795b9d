#include "database_manager.hpp"
#include "logging.hpp"
#include "utils.hpp" // For timeframeToString
#include <algorithm>
#include <stdexcept>

namespace data
{

    namespace
    {
        core::Candle readCandleRow(sqlite3_stmt *stmt)
        {
            core::Candle candle;
            candle.time = sqlite3_column_int64(stmt, 0);
            candle.open = sqlite3_column_double(stmt, 1);
            candle.high = sqlite3_column_double(stmt, 2);
            candle.low = sqlite3_column_double(stmt, 3);
            candle.close = sqlite3_column_double(stmt, 4);
            candle.volume = sqlite3_column_double(stmt, 5);
            return candle;
        }

        std::string columnText(sqlite3_stmt *stmt, int column)
        {
            const unsigned char *text = sqlite3_column_text(stmt, column);
            return text ? reinterpret_cast<const char *>(text) : std::string();
        }
    } // namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect(); // Ensure disconnection
    }

    bool DatabaseManager::connect()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        if (connected_)
        {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        logger->info("Connecting to SQLite database: {}", database_path_);

        // Access is serialized by mutex_, so the connection itself runs without SQLite's mutex
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        sqlite3_busy_timeout(db_, 5000);
        connected_ = true;
        logger->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Usually unfinalized statements
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::executeLocked(const std::string &sql)
    {
        auto logger = core::logging::getLogger();
        if (!connected_ || db_ == nullptr)
        {
            logger->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        logger->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            logger->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        if (!connected_)
        {
            logger->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        logger->info("Initializing SQLite database schema if needed...");

        const std::string create_market_data_sql = R"(
        CREATE TABLE IF NOT EXISTS market_data (
            symbol TEXT NOT NULL,
            tf TEXT NOT NULL,
            time INTEGER NOT NULL, -- Unix seconds, bar open
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume REAL,
            PRIMARY KEY (symbol, tf, time)
        );
    )";

        const std::string create_market_data_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_market_data_symbol_time
        ON market_data (symbol, time);
     )";

        const std::string create_profiles_sql = R"(
        CREATE TABLE IF NOT EXISTS profiles (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            updated_at INTEGER NOT NULL,
            payload TEXT NOT NULL -- Profile JSON document
        );
    )";

        bool success = true;
        success &= executeLocked(create_market_data_sql);
        success &= executeLocked(create_market_data_index_sql);
        success &= executeLocked(create_profiles_sql);

        if (success)
        {
            logger->info("SQLite database schema initialization check complete.");
        }
        else
        {
            logger->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    // --- Candles ---

    core::TimeSeries<core::Candle> DatabaseManager::runCandleQuery(const char *sql,
                                                                   const std::string &symbol,
                                                                   const std::string &tf_label,
                                                                   core::Timestamp a,
                                                                   long long b)
    {
        core::TimeSeries<core::Candle> candles;
        auto logger = core::logging::getLogger();
        if (!connected_)
        {
            logger->error("Cannot query candles: Not connected to database.");
            return candles;
        }

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare candle query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return candles;
        }

        // Index is 1-based
        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, tf_label.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, a);
        sqlite3_bind_int64(stmt, 4, b);

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            candles.push_back(readCandleRow(stmt));
        }

        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through candle query results [{}]: {}", rc, sqlite3_errmsg(db_));
            candles.clear();
        }

        sqlite3_finalize(stmt);
        return candles;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(const std::string &symbol,
                                                                 core::Timeframe tf,
                                                                 core::Timestamp start_time,
                                                                 core::Timestamp end_time)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const char *sql = R"(
            SELECT time, open, high, low, close, volume
            FROM market_data
            WHERE symbol = ? AND tf = ? AND time >= ? AND time <= ?
            ORDER BY time ASC;
        )";
        auto candles = runCandleQuery(sql, symbol, core::utils::timeframeToString(tf), start_time, end_time);
        core::logging::getLogger()->debug("queryCandles {} ({}) [{} .. {}] -> {} rows",
                                          symbol, core::utils::timeframeToString(tf),
                                          core::utils::timestampToString(start_time),
                                          core::utils::timestampToString(end_time), candles.size());
        return candles;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryBefore(const std::string &symbol,
                                                                core::Timeframe tf,
                                                                core::Timestamp before,
                                                                std::size_t limit)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const char *sql = R"(
            SELECT time, open, high, low, close, volume
            FROM market_data
            WHERE symbol = ? AND tf = ? AND time < ?
            ORDER BY time DESC
            LIMIT ?;
        )";
        auto candles = runCandleQuery(sql, symbol, core::utils::timeframeToString(tf), before,
                                      static_cast<long long>(limit));
        std::reverse(candles.begin(), candles.end());
        return candles;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryAfter(const std::string &symbol,
                                                               core::Timeframe tf,
                                                               core::Timestamp after,
                                                               std::size_t limit)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const char *sql = R"(
            SELECT time, open, high, low, close, volume
            FROM market_data
            WHERE symbol = ? AND tf = ? AND time > ?
            ORDER BY time ASC
            LIMIT ?;
        )";
        return runCandleQuery(sql, symbol, core::utils::timeframeToString(tf), after,
                              static_cast<long long>(limit));
    }

    std::optional<core::Candle> DatabaseManager::queryBoundary(const std::string &symbol,
                                                               std::optional<core::Timeframe> tf,
                                                               bool earliest)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        if (!connected_)
        {
            logger->error("Cannot query boundary candle: Not connected to database.");
            return std::nullopt;
        }

        std::string sql = "SELECT time, open, high, low, close, volume FROM market_data WHERE symbol = ?";
        if (tf)
        {
            sql += " AND tf = ?";
        }
        sql += earliest ? " ORDER BY time ASC LIMIT 1;" : " ORDER BY time DESC LIMIT 1;";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare boundary query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return std::nullopt;
        }

        const std::string tf_label = tf ? core::utils::timeframeToString(*tf) : std::string();
        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        if (tf)
        {
            sqlite3_bind_text(stmt, 2, tf_label.c_str(), -1, SQLITE_TRANSIENT);
        }

        std::optional<core::Candle> result;
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW)
        {
            result = readCandleRow(stmt);
        }
        else if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping boundary query [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return result;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &symbol,
                                      core::Timeframe tf)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        const std::string tf_label = core::utils::timeframeToString(tf);
        if (!connected_)
        {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            logger->debug("No candles provided to save for {} ({}).", symbol, tf_label);
            return true; // Nothing to do, report success
        }

        const char *sql = R"(
INSERT OR IGNORE INTO market_data
(symbol, tf, time, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        if (!executeLocked("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving candles.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &candle : candles)
        {
            sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, tf_label.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 3, candle.time);
            sqlite3_bind_double(stmt, 4, candle.open);
            sqlite3_bind_double(stmt, 5, candle.high);
            sqlite3_bind_double(stmt, 6, candle.low);
            sqlite3_bind_double(stmt, 7, candle.close);
            sqlite3_bind_double(stmt, 8, candle.volume);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize the statement BEFORE commit/rollback
        sqlite3_finalize(stmt);

        const char *final_sql = success ? "COMMIT;" : "ROLLBACK;";
        if (!executeLocked(final_sql))
        {
            logger->error("Failed to {} transaction for saving candles.", success ? "COMMIT" : "ROLLBACK");
            if (success)
            {
                executeLocked("ROLLBACK;");
            }
            return false;
        }

        if (success)
        {
            logger->info("Saved {} new candles (duplicates ignored) for {} ({}).", saved_count, symbol, tf_label);
        }
        else
        {
            logger->warn("Transaction rolled back due to error during candle save for {} ({}).", symbol, tf_label);
        }
        return success;
    }

    // --- Profiles ---

    bool DatabaseManager::saveProfile(const ProfileRecord &record)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        if (!connected_)
        {
            logger->error("Cannot save profile: Not connected to database.");
            return false;
        }

        const char *sql = R"(
INSERT INTO profiles (id, name, updated_at, payload) VALUES (?, ?, ?, ?)
ON CONFLICT(id) DO UPDATE SET name = excluded.name, updated_at = excluded.updated_at, payload = excluded.payload;
)";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare profile upsert [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        sqlite3_bind_text(stmt, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, record.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, record.updated_at);
        sqlite3_bind_text(stmt, 4, record.payload.c_str(), -1, SQLITE_TRANSIENT);

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            logger->error("Failed to save profile '{}' [{}]: {}", record.id, rc, sqlite3_errmsg(db_));
            return false;
        }
        logger->debug("Profile '{}' saved ({} bytes).", record.id, record.payload.size());
        return true;
    }

    std::optional<ProfileRecord> DatabaseManager::loadProfile(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        if (!connected_)
        {
            logger->error("Cannot load profile: Not connected to database.");
            return std::nullopt;
        }

        const char *sql = "SELECT id, name, updated_at, payload FROM profiles WHERE id = ?;";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare profile query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return std::nullopt;
        }
        sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

        std::optional<ProfileRecord> record;
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW)
        {
            ProfileRecord row;
            row.id = columnText(stmt, 0);
            row.name = columnText(stmt, 1);
            row.updated_at = sqlite3_column_int64(stmt, 2);
            row.payload = columnText(stmt, 3);
            record = std::move(row);
        }
        else if (rc != SQLITE_DONE)
        {
            logger->error("Error loading profile '{}' [{}]: {}", id, rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return record;
    }

    std::vector<ProfileRecord> DatabaseManager::listProfiles()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ProfileRecord> records;
        auto logger = core::logging::getLogger();
        if (!connected_)
        {
            logger->error("Cannot list profiles: Not connected to database.");
            return records;
        }

        const char *sql = "SELECT id, name, updated_at FROM profiles ORDER BY updated_at DESC, id ASC;";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare profile listing [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return records;
        }

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            ProfileRecord row;
            row.id = columnText(stmt, 0);
            row.name = columnText(stmt, 1);
            row.updated_at = sqlite3_column_int64(stmt, 2);
            records.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE)
        {
            logger->error("Error listing profiles [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return records;
    }

    bool DatabaseManager::deleteProfile(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        if (!connected_)
        {
            logger->error("Cannot delete profile: Not connected to database.");
            return false;
        }

        const char *sql = "DELETE FROM profiles WHERE id = ?;";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare profile delete [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }
        sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt);
        const bool removed = (rc == SQLITE_DONE) && sqlite3_changes(db_) > 0;
        if (rc != SQLITE_DONE)
        {
            logger->error("Failed to delete profile '{}' [{}]: {}", id, rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return removed;
    }

} // namespace data
