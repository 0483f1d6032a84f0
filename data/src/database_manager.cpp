#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // timestampToString
#include <spdlog/fmt/fmt.h>

namespace data
{

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect(bool read_only)
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}{}", database_path_,
                                         read_only ? " (read-only)" : "");

        const int flags = read_only ? SQLITE_OPEN_READONLY
                                    : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_, flags | SQLITE_OPEN_NOMUTEX, nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // The handle must be released even when open fails
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Usually an unfinalized statement
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite kline schema if needed...");

        const std::string create_klines_sql = R"(
        CREATE TABLE IF NOT EXISTS klines (
            symbol TEXT NOT NULL,
            interval TEXT NOT NULL,
            open_time INTEGER NOT NULL, -- epoch milliseconds
            open REAL NOT NULL,
            high REAL NOT NULL,
            low REAL NOT NULL,
            close REAL NOT NULL,
            volume REAL NOT NULL,
            PRIMARY KEY (symbol, interval, open_time)
        );
    )";

        const std::string create_klines_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_klines_open_time
        ON klines (symbol, interval, open_time);
     )";

        bool success = true;
        success &= executeSQL(create_klines_sql);
        success &= executeSQL(create_klines_index_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite kline schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite kline schema initialization failed for one or more statements.");
        }
        return success;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const std::string& symbol,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            throw core::DatabaseException("Cannot query candles: Not connected to database.");
        }

        logger->debug("Querying klines for {} ({}) between {} and {}",
                      symbol, interval, start_time, end_time);

        const char* sql = R"(
            SELECT open_time, open, high, low, close, volume
            FROM klines
            WHERE symbol = ?
              AND interval = ?
              AND open_time >= ?
              AND open_time <= ?
            ORDER BY open_time ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            std::string message = fmt::format("Failed to prepare kline query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            throw core::DatabaseException(message);
        }

        // Parameter indexes are 1-based
        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(stmt, 3, start_time);
        sqlite3_bind_int64(stmt, 4, end_time);

        core::TimeSeries<core::Candle> candles;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            core::Candle candle;
            candle.timestamp = sqlite3_column_int64(stmt, 0);
            candle.open = sqlite3_column_double(stmt, 1);
            candle.high = sqlite3_column_double(stmt, 2);
            candle.low = sqlite3_column_double(stmt, 3);
            candle.close = sqlite3_column_double(stmt, 4);
            candle.volume = sqlite3_column_double(stmt, 5);
            candles.push_back(candle);
        }

        if (rc != SQLITE_DONE) {
            std::string message = fmt::format("Error stepping through kline query results [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            throw core::DatabaseException(message);
        }
        sqlite3_finalize(stmt);

        if (!candles.empty()) {
            logger->debug("Loaded {} klines for {} ({}), {} .. {}", candles.size(), symbol, interval,
                          core::utils::timestampToString(candles.front().timestamp),
                          core::utils::timestampToString(candles.back().timestamp));
        } else {
            logger->warn("No klines stored for {} ({}) in the requested range.", symbol, interval);
        }
        return candles;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const std::string &symbol,
                                      const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            logger->debug("No candles provided to save for {} ({}).", symbol, interval);
            return true;
        }

        // Duplicates on (symbol, interval, open_time) are ignored
        const char *sql = R"(
INSERT OR IGNORE INTO klines
(symbol, interval, open_time, open, high, low, close, volume)
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

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving candles.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &candle : candles)
        {
            sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_STATIC);
            sqlite3_bind_int64(stmt, 3, candle.timestamp);
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

        // Finalize before COMMIT/ROLLBACK
        sqlite3_finalize(stmt);

        if (success)
        {
            if (!executeSQL("COMMIT;"))
            {
                logger->error("Failed to COMMIT transaction for saving candles.");
                if (!executeSQL("ROLLBACK;"))
                {
                    logger->critical("ROLLBACK after failed COMMIT also failed for {} ({}).", symbol, interval);
                }
                return false;
            }
            logger->info("Saved {} new klines (duplicates ignored) for {} ({}).", saved_count, symbol, interval);
            return true;
        }

        if (!executeSQL("ROLLBACK;"))
        {
            logger->critical("Failed to ROLLBACK transaction for {} ({}).", symbol, interval);
        }
        else
        {
            logger->warn("Transaction rolled back due to error during kline save for {} ({}).", symbol, interval);
        }
        return false;
    }

} // namespace data
