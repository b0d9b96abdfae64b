#include "sqlite_sighting_store.hpp"

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

LogEntry MakeEntry(int64_t timestamp, const std::string& ip, const std::string& name) {
  LogEntry entry;
  entry.timestamp = timestamp;
  entry.ip        = ip;
  entry.name      = name;
  return entry;
}

std::filesystem::path TempDbPath(const std::string& tag) {
  return std::filesystem::temp_directory_path() /
         ("owl_store_" + tag + "_" + std::to_string(getpid()) + ".sqlite");
}

void RemoveDb(const std::filesystem::path& path) {
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + "-wal");
  std::filesystem::remove(path.string() + "-shm");
}

void TestIdsIncreaseInAppendOrder() {
  SqliteSightingStore store(SQLITE_IN_MEMORY);
  int64_t a = store.append(MakeEntry(300, "10.0.0.1", "A"));
  int64_t b = store.append(MakeEntry(100, "10.0.0.2", "B"));
  int64_t c = store.append(MakeEntry(200, "10.0.0.3", "C"));
  assert(a < b && b < c);
  assert(store.size() == 3);
}

void TestDistinctNamesYieldOneRowEach() {
  SqliteSightingStore store(SQLITE_IN_MEMORY);
  const int kHosts = 25;
  for (int i = 0; i < kHosts; ++i) {
    store.append(MakeEntry(1000 + i, "192.168.1." + std::to_string(i), "HOST-" + std::to_string(i)));
  }

  auto rows = store.latestPerName();
  assert(rows.size() == static_cast<size_t>(kHosts));

  // newest timestamp first
  for (size_t i = 1; i < rows.size(); ++i) {
    assert(rows[i - 1].timestamp >= rows[i].timestamp);
  }
  assert(rows.front().name == "HOST-24");
  assert(rows.back().name == "HOST-0");
}

void TestRepeatedNameCollapsesToLatestById() {
  SqliteSightingStore store(SQLITE_IN_MEMORY);
  store.append(MakeEntry(500, "10.0.0.5", "ALICE-PC"));
  store.append(MakeEntry(700, "10.0.0.6", "ALICE-PC"));
  // capture clock went backwards: still the latest sighting
  int64_t last = store.append(MakeEntry(600, "10.0.0.7", "ALICE-PC"));

  auto rows = store.latestPerName();
  assert(rows.size() == 1);
  assert(rows[0].id == last);
  assert(rows[0].timestamp == 600);
  assert(rows[0].ip == "10.0.0.7");
  assert(store.size() == 3);
}

void TestManyRepeatsAcrossHosts() {
  SqliteSightingStore store(SQLITE_IN_MEMORY);
  std::map<std::string, int64_t> last_id;
  for (int round = 0; round < 10; ++round) {
    for (const char* name : {"ALPHA", "BRAVO", "CHARLIE"}) {
      last_id[name] = store.append(MakeEntry(round, "10.1.0." + std::to_string(round), name));
    }
  }

  auto rows = store.latestPerName();
  assert(rows.size() == 3);
  for (const auto& row : rows) {
    assert(row.id == last_id[row.name]);
    assert(row.ip == "10.1.0.9");
  }
}

void TestEmptyStore() {
  SqliteSightingStore store(SQLITE_IN_MEMORY);
  assert(store.latestPerName().empty());
  assert(store.size() == 0);
}

void TestOverlongIpRejected() {
  SqliteSightingStore store(SQLITE_IN_MEMORY);
  bool threw = false;
  try {
    store.append(MakeEntry(1, "1234.1234.1234.1234", "X"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(store.size() == 0);
}

void TestFileStoreSurvivesReopen() {
  const auto path = TempDbPath("reopen");
  RemoveDb(path);
  {
    SqliteSightingStore store(path.string());
    store.append(MakeEntry(10, "10.0.0.1", "KEEP-ME"));
    store.append(MakeEntry(20, "10.0.0.2", "KEEP-ME"));
  }
  {
    SqliteSightingStore store(path.string());
    assert(store.size() == 2);
    int64_t id = store.append(MakeEntry(30, "10.0.0.3", "NEW"));
    assert(id == 3);
    auto rows = store.latestPerName();
    assert(rows.size() == 2);
    assert(rows[0].name == "NEW");
    assert(rows[1].name == "KEEP-ME" && rows[1].ip == "10.0.0.2");
  }
  RemoveDb(path);
}

void TestConcurrentReaderSeesOnlyWholeRows() {
  SqliteSightingStore store(SQLITE_IN_MEMORY);
  const int kWrites = 300;

  std::thread writer([&] {
    for (int i = 0; i < kWrites; ++i) {
      store.append(MakeEntry(i, "10.0.0." + std::to_string(i % 250), "HOST-" + std::to_string(i % 7)));
    }
  });

  for (int i = 0; i < 100; ++i) {
    auto rows = store.latestPerName();
    assert(rows.size() <= 7);
    for (const auto& row : rows) {
      assert(!row.name.empty());
      assert(!row.ip.empty());
    }
  }
  writer.join();

  assert(store.size() == static_cast<size_t>(kWrites));
  assert(store.latestPerName().size() == 7);
}

} // namespace

int main() {
  TestIdsIncreaseInAppendOrder();
  TestDistinctNamesYieldOneRowEach();
  TestRepeatedNameCollapsesToLatestById();
  TestManyRepeatsAcrossHosts();
  TestEmptyStore();
  TestOverlongIpRejected();
  TestFileStoreSurvivesReopen();
  TestConcurrentReaderSeesOnlyWholeRows();

  std::cout << "owl_unit_sqlite_sighting_store: pass\n";
  return 0;
}
