#pragma once

#include <string>
#include <vector>
#include <memory>

#include <sqlite3.h>

#include "datatypes.hpp"

namespace data {

// SQLite-backed kline store. One row per (symbol, interval, open_time).
class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Owns a raw sqlite3 handle
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // read_only opens an existing database without creating it; a missing file fails
    bool connect(bool read_only = false);
    void disconnect();
    bool isConnected() const;

    // Creates the klines table and its index if missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // Inserts candles in one transaction. Rows whose key already exists are left untouched.
    // Returns false (after rolling back) on any SQLite error.
    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const std::string& symbol,
                     const std::string& interval);

    // Candles with start_time <= open_time <= end_time, ordered by open_time.
    // Throws core::DatabaseException if not connected or on SQLite errors.
    core::TimeSeries<core::Candle> queryCandles(
        const std::string& symbol,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;
};

} // namespace data
