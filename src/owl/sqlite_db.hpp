#ifndef SQLITE_DB_HPP
#define SQLITE_DB_HPP

#include <sqlite3.h>

#include <string>

// Path understood by SqliteDB as a private in-memory database
constexpr const char* SQLITE_IN_MEMORY = ":memory:";

/*
  Thin RAII wrapper around a sqlite3* connection.
  Opened in serialized mode, so the handle may be shared between threads.
*/
class SqliteDB
{
   public:
    explicit SqliteDB(const std::string& path);
    ~SqliteDB();

    SqliteDB(const SqliteDB&) = delete;
    SqliteDB& operator=(const SqliteDB&) = delete;

    sqlite3* handle() const { return m_db; }

    // Execute one or more SQL statements (pragmas, DDL, transaction control)
    void exec(const std::string& sql);

    // Prepare a statement (caller must sqlite3_finalize)
    sqlite3_stmt* prepare(const std::string& sql);

   private:
    void configure();

    sqlite3* m_db{nullptr};
    std::string m_path;
};

/*
  Write transaction scoped to an object lifetime.

  Uses BEGIN IMMEDIATE to take the write lock up front. Rolls back on
  destruction unless commit() succeeded.
*/
class SqliteTransaction
{
   public:
    explicit SqliteTransaction(SqliteDB& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

   private:
    SqliteDB& m_db;
    bool m_finished{false};
};

#endif  // SQLITE_DB_HPP
