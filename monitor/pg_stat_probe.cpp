#include "pg_stat_probe.hpp"

#include <memory>

#include <sqlpp11/sqlpp11.h>
#include <sqlpp11/postgresql/exception.h>

namespace {
SQLPP_ALIAS_PROVIDER(active_count)
}

tables::PgStatDatabase PgStatProbe::stat_database;
tables::PgStatActivity PgStatProbe::stat_activity;

PgStatProbe::PgStatProbe(const DatastoreConfig& cfg) : cfg_(cfg)
{
    auto config = std::make_shared<sqlpp::postgresql::connection_config>();

    config->dbname = cfg_.dbname;
    config->user = cfg_.user;
    config->password = cfg_.password;
    config->host = cfg_.host;
    config->port = static_cast<uint32_t>(cfg_.port);
    // config->debug = true; // Uncomment for verbose debugging output

    try
    {
        db.connectUsing(config);
    }
    catch (const std::exception& e)
    {
        throw DatastoreError("could not connect to " + Describe() + ": " + e.what());
    }
}

DatastoreSample PgStatProbe::Sample()
{
    DatastoreSample sample;
    sample.timestamp = std::chrono::system_clock::now();
    auto start_time = std::chrono::steady_clock::now();

    try
    {
        auto stats = db(sqlpp::select(all_of(stat_database))
                            .from(stat_database)
                            .where(stat_database.datname == cfg_.dbname));
        if (stats.empty())
        {
            throw DatastoreError("database '" + cfg_.dbname + "' has no row in pg_stat_database");
        }
        const auto& row = stats.front();
        sample.connections = row.numbackends.value();
        sample.commits = row.xact_commit.value();
        sample.rollbacks = row.xact_rollback.value();
        sample.blks_read = row.blks_read.value();
        sample.blks_hit = row.blks_hit.value();
        sample.tup_returned = row.tup_returned.value();
        sample.tup_fetched = row.tup_fetched.value();
        sample.tup_inserted = row.tup_inserted.value();
        sample.tup_updated = row.tup_updated.value();
        sample.tup_deleted = row.tup_deleted.value();

        auto active = db(sqlpp::select(sqlpp::count(stat_activity.pid).as(active_count))
                             .from(stat_activity)
                             .where(stat_activity.datname == cfg_.dbname and stat_activity.state == "active"));
        if (!active.empty())
        {
            sample.active_operations = active.front().active_count.value();
        }
    }
    catch (const sqlpp::exception& e)
    {
        throw DatastoreError(std::string("sampling failed: ") + e.what());
    }

    sample.latency_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_time).count();
    return sample;
}

std::string PgStatProbe::Describe() const
{
    return "postgresql://" + cfg_.user + "@" + cfg_.host + ":" + std::to_string(cfg_.port) + "/" + cfg_.dbname;
}
