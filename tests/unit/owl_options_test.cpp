#include "owl_options.hpp"

#include <unistd.h>

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace {

OwlOptions Parse(std::vector<std::string> args) {
  args.insert(args.begin(), "owl");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return parseOptions(static_cast<int>(args.size()), argv.data());
}

bool Rejected(const std::vector<std::string>& args) {
  try {
    Parse(args);
  } catch (const OptionsError&) {
    return true;
  }
  return false;
}

void TestDefaults() {
  OwlOptions options = Parse({});
  assert(options.interface == "any");
  assert(std::string(DEFAULT_CAPTURE_INTERFACE) == "any");
  assert(options.filter.empty());
  assert(options.render.columns == "niA");
  assert(!options.render.anonymize);
  assert(options.render.interval_seconds == 2);
  assert(options.render.locale == "en");
  assert(options.use_cache);
  assert(options.cache_file.empty());
  assert(options.log_level == LogLevel::ERROR);
  assert(!options.show_timestamp);
  assert(options.log_file.empty());
  assert(!options.show_help);
}

void TestAllFlags() {
  OwlOptions options = Parse({"-i", "eth0", "-f", "host 10.0.0.5", "-a", "-c", "TIni", "-n", "5",
                              "-l", "it_IT", "-C", "/tmp/owl.sqlite", "-v", "1", "--timestamp",
                              "--log-file", "/tmp/owl.log"});
  assert(options.interface == "eth0");
  assert(options.filter == "host 10.0.0.5");
  assert(options.render.anonymize);
  assert(options.render.columns == "TIni");
  assert(options.render.interval_seconds == 5);
  assert(options.render.locale == "it_IT");
  assert(options.use_cache);
  assert(options.cache_file == "/tmp/owl.sqlite");
  assert(options.log_level == LogLevel::INFO);
  assert(options.show_timestamp);
  assert(options.log_file == "/tmp/owl.log");
}

void TestLongForms() {
  OwlOptions options = Parse({"--interface", "wlan0", "--filter", "net 192.168.0.0/16", "--columns",
                              "A", "--interval", "10", "--locale", "de", "--cache", "c.db", "--quiet"});
  assert(options.interface == "wlan0");
  assert(options.filter == "net 192.168.0.0/16");
  assert(options.render.columns == "A");
  assert(options.render.interval_seconds == 10);
  assert(options.render.locale == "de");
  assert(options.cache_file == "c.db");
  assert(options.log_level == LogLevel::NONE);

  assert(Parse({"-l", "fr"}).render.locale == "fr");
  assert(Parse({"--locale", "es_ES"}).render.locale == "es_ES");

  assert(Parse({"--help"}).show_help);
  assert(Parse({"-h"}).show_help);
}

void TestNoCache() {
  OwlOptions options = Parse({"--no-cache"});
  assert(!options.use_cache);
  assert(resolveStorePath(options) == SQLITE_IN_MEMORY);
}

void TestInvalidOptionsRejected() {
  assert(Rejected({"-c", "nx"}));
  assert(Rejected({"-c", ""}));
  assert(Rejected({"-C", "a.db", "--no-cache"}));
  assert(Rejected({"--no-cache", "--cache", "a.db"}));
  assert(Rejected({"-C", ""}));
  assert(Rejected({"-n", "0"}));
  assert(Rejected({"-n", "-3"}));
  assert(Rejected({"-n", "2s"}));
  assert(Rejected({"-n", "99999999999"}));
  assert(Rejected({"-l", "xx"}));
  assert(Rejected({"-v", "4"}));
  assert(Rejected({"-v", "12"}));
  assert(Rejected({"-i"}));
  assert(Rejected({"-a", "--columns"}));
  assert(Rejected({"--bogus"}));
  assert(Rejected({"eth0"}));
}

void TestDefaultCachePath() {
  setenv("XDG_CACHE_HOME", "/var/cache/me", 1);
  setenv("HOME", "/home/me", 1);
  assert(defaultCachePath() == "/var/cache/me/owl/cache.sqlite");

  // relative XDG paths are ignored
  setenv("XDG_CACHE_HOME", "relative/cache", 1);
  assert(defaultCachePath() == "/home/me/.cache/owl/cache.sqlite");

  unsetenv("XDG_CACHE_HOME");
  assert(defaultCachePath() == "/home/me/.cache/owl/cache.sqlite");

  unsetenv("HOME");
  bool threw = false;
  try {
    defaultCachePath();
  } catch (const OptionsError&) {
    threw = true;
  }
  assert(threw);
}

void TestResolveStorePathCreatesCacheDirectory() {
  char tmpl[] = "/tmp/owl_options_test_XXXXXX";
  char* dir = mkdtemp(tmpl);
  assert(dir != nullptr);
  setenv("XDG_CACHE_HOME", dir, 1);

  OwlOptions options = Parse({});
  const std::string path = resolveStorePath(options);
  assert(path == std::string(dir) + "/owl/cache.sqlite");
  assert(std::filesystem::is_directory(std::string(dir) + "/owl"));

  // an explicit file is used as given
  options.cache_file = "explicit.sqlite";
  assert(resolveStorePath(options) == "explicit.sqlite");

  std::filesystem::remove_all(dir);
}

void TestUsageListsColumns() {
  std::ostringstream out;
  printUsage(out, "owl");
  const std::string text = out.str();
  assert(text.find("Usage: owl") == 0);
  assert(text.find("last seen in ISO 8601 format") != std::string::npos);
  assert(text.find("--no-cache") != std::string::npos);
  assert(text.find("press q or CTRL+C to quit") != std::string::npos);
}

} // namespace

int main() {
  TestDefaults();
  TestAllFlags();
  TestLongForms();
  TestNoCache();
  TestInvalidOptionsRejected();
  TestDefaultCachePath();
  TestResolveStorePathCreatesCacheDirectory();
  TestUsageListsColumns();

  std::cout << "owl_unit_owl_options: pass\n";
  return 0;
}
