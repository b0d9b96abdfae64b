#ifndef OWL_OPTIONS_HPP
#define OWL_OPTIONS_HPP

#include <ostream>
#include <stdexcept>
#include <string>

#include "live_view_renderer.hpp"
#include "logger.hpp"

constexpr const char* PROGRAM_NAME = "owl";
constexpr const char* DEFAULT_CACHE_FILENAME = "cache.sqlite";

// libpcap pseudo-device capturing on every interface
constexpr const char* DEFAULT_CAPTURE_INTERFACE = "any";

// Invalid command line; the message is meant for the user
class OptionsError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

struct OwlOptions
{
    std::string interface{DEFAULT_CAPTURE_INTERFACE};
    std::string filter;  // extra BPF expression, may be empty
    RenderOptions render;
    bool use_cache{true};
    std::string cache_file;  // empty: default location under the XDG cache dir
    LogLevel log_level{LogLevel::ERROR};
    bool show_timestamp{false};
    std::string log_file;
    bool show_help{false};
};

// Throws OptionsError on any invalid or conflicting option
OwlOptions parseOptions(int argc, char** argv);

void printUsage(std::ostream& out, const char* prog);

// $XDG_CACHE_HOME/owl/cache.sqlite, or ~/.cache/owl/cache.sqlite
std::string defaultCachePath();

// Database path for the store; creates the default cache directory if
// needed. Returns the in-memory path when caching is disabled.
std::string resolveStorePath(const OwlOptions& options);

#endif  // OWL_OPTIONS_HPP
