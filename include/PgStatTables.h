#pragma once

#include <sqlpp11/table.h>
#include <sqlpp11/data_types.h>
#include <sqlpp11/char_sequence.h>

// Read-only views over the PostgreSQL cumulative statistics system.
// Only the columns the datastore monitor samples are declared.
namespace tables
{
  namespace PgStatDatabase_
  {
    // NULL for the row that aggregates shared objects
    struct Datname
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "datname";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T datname;
          T& operator()() { return datname; }
          const T& operator()() const { return datname; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::text, sqlpp::tag::can_be_null>;
    };
    // connections currently open to this database
    struct Numbackends
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "numbackends";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T numbackends;
          T& operator()() { return numbackends; }
          const T& operator()() const { return numbackends; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::integer>;
    };
    struct XactCommit
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "xact_commit";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T xact_commit;
          T& operator()() { return xact_commit; }
          const T& operator()() const { return xact_commit; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::integer>;
    };
    struct XactRollback
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "xact_rollback";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T xact_rollback;
          T& operator()() { return xact_rollback; }
          const T& operator()() const { return xact_rollback; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::integer>;
    };
    struct BlksRead
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "blks_read";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T blks_read;
          T& operator()() { return blks_read; }
          const T& operator()() const { return blks_read; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::integer>;
    };
    struct BlksHit
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "blks_hit";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T blks_hit;
          T& operator()() { return blks_hit; }
          const T& operator()() const { return blks_hit; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::integer>;
    };
    struct TupReturned
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "tup_returned";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T tup_returned;
          T& operator()() { return tup_returned; }
          const T& operator()() const { return tup_returned; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::integer>;
    };
    struct TupFetched
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "tup_fetched";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T tup_fetched;
          T& operator()() { return tup_fetched; }
          const T& operator()() const { return tup_fetched; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::integer>;
    };
    struct TupInserted
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "tup_inserted";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T tup_inserted;
          T& operator()() { return tup_inserted; }
          const T& operator()() const { return tup_inserted; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::integer>;
    };
    struct TupUpdated
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "tup_updated";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T tup_updated;
          T& operator()() { return tup_updated; }
          const T& operator()() const { return tup_updated; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::integer>;
    };
    struct TupDeleted
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "tup_deleted";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T tup_deleted;
          T& operator()() { return tup_deleted; }
          const T& operator()() const { return tup_deleted; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::integer>;
    };
  }

  // One row per database, counters are cumulative since the last stats reset
  struct PgStatDatabase : sqlpp::table_t<PgStatDatabase,
                           PgStatDatabase_::Datname,
                           PgStatDatabase_::Numbackends,
                           PgStatDatabase_::XactCommit,
                           PgStatDatabase_::XactRollback,
                           PgStatDatabase_::BlksRead,
                           PgStatDatabase_::BlksHit,
                           PgStatDatabase_::TupReturned,
                           PgStatDatabase_::TupFetched,
                           PgStatDatabase_::TupInserted,
                           PgStatDatabase_::TupUpdated,
                           PgStatDatabase_::TupDeleted>
  {
    using _value_type = sqlpp::no_value_t;
    struct _alias_t
    {
      static constexpr const char _literal[] =  "pg_stat_database";
      using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
      template<typename T>
      struct _member_t
      {
        T pgStatDatabase;
        T& operator()() { return pgStatDatabase; }
        const T& operator()() const { return pgStatDatabase; }
      };
    };
  };

  namespace PgStatActivity_
  {
    struct Pid
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "pid";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T pid;
          T& operator()() { return pid; }
          const T& operator()() const { return pid; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::integer>;
    };
    struct Datname
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "datname";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T datname;
          T& operator()() { return datname; }
          const T& operator()() const { return datname; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::text, sqlpp::tag::can_be_null>;
    };
    // 'active', 'idle', ... (NULL for background workers)
    struct State
    {
      struct _alias_t
      {
        static constexpr const char _literal[] =  "state";
        using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
        template<typename T>
        struct _member_t
        {
          T state;
          T& operator()() { return state; }
          const T& operator()() const { return state; }
        };
      };
      using _traits = sqlpp::make_traits<sqlpp::text, sqlpp::tag::can_be_null>;
    };
  }

  // One row per server process
  struct PgStatActivity : sqlpp::table_t<PgStatActivity,
                           PgStatActivity_::Pid,
                           PgStatActivity_::Datname,
                           PgStatActivity_::State>
  {
    using _value_type = sqlpp::no_value_t;
    struct _alias_t
    {
      static constexpr const char _literal[] =  "pg_stat_activity";
      using _name_t = sqlpp::make_char_sequence<sizeof(_literal), _literal>;
      template<typename T>
      struct _member_t
      {
        T pgStatActivity;
        T& operator()() { return pgStatActivity; }
        const T& operator()() const { return pgStatActivity; }
      };
    };
  };
}
