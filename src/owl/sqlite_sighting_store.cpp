#include "sqlite_sighting_store.hpp"

#include <memory>
#include <stdexcept>

#include "logger.hpp"

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

static const char* const CREATE_LOG_ENTRY_SQL =
    "CREATE TABLE IF NOT EXISTS log_entry ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " timestamp INTEGER,"
    " ip VARCHAR(16),"
    " name VARCHAR"
    ");";

static const char* const INSERT_LOG_ENTRY_SQL =
    "INSERT INTO log_entry(timestamp, ip, name) VALUES(?, ?, ?);";

// Rank rows within each name by insertion order and keep the newest one.
// Capture timestamps are not trusted for ordering.
static const char* const LATEST_PER_NAME_SQL =
    "SELECT id, timestamp, ip, name FROM ("
    " SELECT id, timestamp, ip, name,"
    "  ROW_NUMBER() OVER (PARTITION BY name ORDER BY id DESC) AS rn"
    " FROM log_entry"
    ") WHERE rn = 1 ORDER BY timestamp DESC, id DESC;";

static const char* const COUNT_SQL = "SELECT COUNT(*) FROM log_entry;";

static std::string colText(sqlite3_stmt* st, int col)
{
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

SqliteSightingStore::SqliteSightingStore(const std::string& path) : m_db(path)
{
    createSchema();
}

void SqliteSightingStore::createSchema()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_db.exec(CREATE_LOG_ENTRY_SQL);
}

int64_t SqliteSightingStore::append(const LogEntry& entry)
{
    if (entry.ip.size() > LOG_ENTRY_IP_MAX_LEN)
    {
        throw std::invalid_argument("IP address too long for log entry: " + entry.ip);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3* db = m_db.handle();

    SqliteTransaction tx(m_db);
    StatementPtr st(m_db.prepare(INSERT_LOG_ENTRY_SQL), &sqlite3_finalize);

    sqlite3_bind_int64(st.get(), 1, static_cast<sqlite3_int64>(entry.timestamp));
    sqlite3_bind_text(st.get(), 2, entry.ip.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.get(), 3, entry.name.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(st.get()) != SQLITE_DONE)
    {
        throw std::runtime_error(std::string("insert into log_entry failed: ") +
                                 sqlite3_errmsg(db));
    }
    int64_t id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    st.reset();

    tx.commit();
    LOG_DEBUG("Appended log entry " << id << ": " << entry.name << " " << entry.ip);
    return id;
}

std::vector<LogEntry> SqliteSightingStore::latestPerName()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    StatementPtr st(m_db.prepare(LATEST_PER_NAME_SQL), &sqlite3_finalize);

    std::vector<LogEntry> rows;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW)
    {
        LogEntry entry;
        entry.id = static_cast<int64_t>(sqlite3_column_int64(st.get(), 0));
        entry.timestamp = static_cast<int64_t>(sqlite3_column_int64(st.get(), 1));
        entry.ip = colText(st.get(), 2);
        entry.name = colText(st.get(), 3);
        rows.push_back(std::move(entry));
    }
    if (rc != SQLITE_DONE)
    {
        throw std::runtime_error(std::string("latest-per-name query failed: ") +
                                 sqlite3_errmsg(m_db.handle()));
    }
    return rows;
}

size_t SqliteSightingStore::size()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    StatementPtr st(m_db.prepare(COUNT_SQL), &sqlite3_finalize);
    if (sqlite3_step(st.get()) != SQLITE_ROW)
    {
        throw std::runtime_error(std::string("count query failed: ") +
                                 sqlite3_errmsg(m_db.handle()));
    }
    return static_cast<size_t>(sqlite3_column_int64(st.get(), 0));
}
