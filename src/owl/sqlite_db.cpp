#include "sqlite_db.hpp"

#include <stdexcept>

#include "logger.hpp"

constexpr int SQLITE_BUSY_TIMEOUT_MS = 5000;

static void throwIf(int rc, sqlite3* db, const char* what)
{
    if (rc != SQLITE_OK)
    {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

SqliteDB::SqliteDB(const std::string& path) : m_path(path)
{
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(m_path.c_str(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "sqlite open failed";
        if (m_db)
        {
            sqlite3_close(m_db);
        }
        m_db = nullptr;
        throw std::runtime_error("cannot open database '" + m_path + "': " + msg);
    }

    configure();
    LOG_INFO("Opened sighting database: " << m_path);
}

SqliteDB::~SqliteDB()
{
    if (m_db != nullptr)
    {
        sqlite3_close(m_db);
    }
}

void SqliteDB::exec(const std::string& sql)
{
    char* err = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK)
    {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw std::runtime_error(msg);
    }
}

sqlite3_stmt* SqliteDB::prepare(const std::string& sql)
{
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);
    throwIf(rc, m_db, "sqlite prepare");
    return stmt;
}

void SqliteDB::configure()
{
    if (m_path != SQLITE_IN_MEMORY)
    {
        // WAL lets the renderer read while the writer appends
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
    }

    // wait for locks held by another owl process on the same cache file
    throwIf(sqlite3_busy_timeout(m_db, SQLITE_BUSY_TIMEOUT_MS), m_db, "busy_timeout");

    exec("PRAGMA temp_store=MEMORY;");
}

SqliteTransaction::SqliteTransaction(SqliteDB& db) : m_db(db)
{
    m_db.exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction()
{
    if (m_finished)
    {
        return;
    }
    char* err = nullptr;
    if (sqlite3_exec(m_db.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK)
    {
        LOG_ERROR("Rollback failed: " << (err ? err : sqlite3_errmsg(m_db.handle())));
    }
    sqlite3_free(err);
}

void SqliteTransaction::commit()
{
    m_db.exec("COMMIT;");
    m_finished = true;
}
