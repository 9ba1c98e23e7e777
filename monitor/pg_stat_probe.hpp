#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

#include <sqlpp11/postgresql/postgresql.h>
#include "PgStatTables.h"
#include "run_config.hpp"

class DatastoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief One reading of the datastore's cumulative counters.
 */
struct DatastoreSample {
    std::chrono::system_clock::time_point timestamp;
    long long connections = 0;
    long long commits = 0;
    long long rollbacks = 0;
    long long tup_returned = 0;
    long long tup_fetched = 0;
    long long tup_inserted = 0;
    long long tup_updated = 0;
    long long tup_deleted = 0;
    long long blks_read = 0;
    long long blks_hit = 0;
    long long active_operations = 0;
    double latency_ms = 0.0;       // round trip of the sampling queries
};

/**
 * @brief Something the datastore monitor can poll.
 */
class IDatastoreProbe {
public:
    virtual ~IDatastoreProbe() = default;

    // Throws DatastoreError when the datastore cannot be read.
    virtual DatastoreSample Sample() = 0;

    virtual std::string Describe() const = 0;
};

/**
 * @brief Reads pg_stat_database and pg_stat_activity for one database.
 *
 * The connection is opened in the constructor and closed with the object.
 */
class PgStatProbe : public IDatastoreProbe {
public:
    static tables::PgStatDatabase stat_database;
    static tables::PgStatActivity stat_activity;

    sqlpp::postgresql::connection db;

    explicit PgStatProbe(const DatastoreConfig& cfg);

    DatastoreSample Sample() override;

    std::string Describe() const override;

private:
    DatastoreConfig cfg_;
};
