#ifndef SQLITE_SIGHTING_STORE_HPP
#define SQLITE_SIGHTING_STORE_HPP

#include <mutex>
#include <string>
#include <vector>

#include "sighting_store.hpp"
#include "sqlite_db.hpp"

// SightingStore backed by the SQLite table `log_entry`.
// Pass SQLITE_IN_MEMORY as path for a store that lives only as long as the process.
class SqliteSightingStore : public SightingStore
{
   public:
    explicit SqliteSightingStore(const std::string& path);
    ~SqliteSightingStore() override = default;

    int64_t append(const LogEntry& entry) override;
    std::vector<LogEntry> latestPerName() override;
    size_t size() override;

   private:
    void createSchema();

    SqliteDB m_db;
    // One connection is shared by the writer and the renderer; statements
    // and transactions on it must not interleave.
    std::mutex m_mutex;
};

#endif  // SQLITE_SIGHTING_STORE_HPP
