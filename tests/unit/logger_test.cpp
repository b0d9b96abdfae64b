#include "logger.hpp"

#include <unistd.h>

#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace {

std::string ReadAll(const std::string& path) {
  std::ifstream in(path);
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestLevelFilteringAndFileOutput(const std::string& path) {
  assert(Logger::setOutputFile(path));
  Logger::setShowTimestamp(false);
  Logger::setLevel(LogLevel::WARNING);
  assert(Logger::getLevel() == LogLevel::WARNING);
  assert(!Logger::isEnabled(LogLevel::INFO));
  assert(Logger::isEnabled(LogLevel::ERROR));

  LOG_INFO("hidden info line");
  LOG_WARNING("visible warning " << 42);
  LOG_ERROR("visible error");

  const std::string text = ReadAll(path);
  assert(!Contains(text, "hidden info line"));
  assert(Contains(text, "[WARN] visible warning 42\n"));
  // errors carry their source location
  assert(Contains(text, "[ERROR] "));
  assert(Contains(text, "logger_test.cpp:"));
  assert(Contains(text, " - visible error\n"));
}

void TestThreadRoleTag(const std::string& path) {
  Logger::setLevel(LogLevel::INFO);

  std::thread worker([] {
    Logger::setThreadRole("capture");
    LOG_INFO("from the worker");
  });
  worker.join();
  LOG_INFO("from main without a role");

  const std::string text = ReadAll(path);
  assert(Contains(text, "[INFO] [capture] from the worker\n"));
  assert(Contains(text, "[INFO] from main without a role\n"));
}

void TestTimestampPrefix(const std::string& path) {
  Logger::setShowTimestamp(true);
  LOG_INFO("stamped");
  Logger::setShowTimestamp(false);

  const std::string text = ReadAll(path);
  size_t pos = text.find("] [INFO] stamped\n");
  assert(pos != std::string::npos);
  // "[YYYY-MM-DD HH:MM:SS" precedes the level
  assert(pos >= 20);
  assert(text[pos - 20] == '[');
}

void TestNoneSilencesEverything(const std::string& path) {
  Logger::setLevel(LogLevel::NONE);
  LOG_ERROR("silenced error");
  assert(!Contains(ReadAll(path), "silenced error"));
}

void TestUnopenableFile() {
  assert(!Logger::setOutputFile("/nonexistent-dir/owl/log.txt"));
}

} // namespace

int main() {
  char tmpl[] = "/tmp/owl_logger_test_XXXXXX";
  int fd = mkstemp(tmpl);
  assert(fd >= 0);
  close(fd);
  const std::string path = tmpl;

  TestLevelFilteringAndFileOutput(path);
  TestThreadRoleTag(path);
  TestTimestampPrefix(path);
  TestNoneSilencesEverything(path);
  TestUnopenableFile();

  std::remove(path.c_str());
  std::cout << "owl_unit_logger: pass\n";
  return 0;
}
