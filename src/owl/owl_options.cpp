#include "owl_options.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>

#include "sqlite_db.hpp"
#include "time_format.hpp"

static bool isFlag(const char* arg, const char* short_name, const char* long_name)
{
    return (short_name != nullptr && std::strcmp(arg, short_name) == 0) ||
           (long_name != nullptr && std::strcmp(arg, long_name) == 0);
}

static const char* requireValue(int argc, char** argv, int& i)
{
    if (i + 1 >= argc)
    {
        throw OptionsError(std::string("option ") + argv[i] + " requires a value");
    }
    return argv[++i];
}

static void validateColumns(const std::string& columns)
{
    if (columns.empty())
    {
        throw OptionsError("'' is not a valid list of columns");
    }
    for (char code : columns)
    {
        if (findViewColumn(code) == nullptr)
        {
            throw OptionsError("'" + columns + "' is not a valid list of columns");
        }
    }
}

static unsigned parseInterval(const char* text)
{
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value <= 0 || value > INT_MAX)
    {
        throw OptionsError(std::string("invalid interval '") + text +
                           "', expected a positive number of seconds");
    }
    return static_cast<unsigned>(value);
}

OwlOptions parseOptions(int argc, char** argv)
{
    OwlOptions options;
    bool cache_given = false;
    bool no_cache_given = false;

    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];
        if (isFlag(arg, "-h", "--help"))
        {
            options.show_help = true;
        }
        else if (isFlag(arg, "-i", "--interface"))
        {
            options.interface = requireValue(argc, argv, i);
        }
        else if (isFlag(arg, "-f", "--filter"))
        {
            options.filter = requireValue(argc, argv, i);
        }
        else if (isFlag(arg, "-a", nullptr))
        {
            options.render.anonymize = true;
        }
        else if (isFlag(arg, "-c", "--columns"))
        {
            options.render.columns = requireValue(argc, argv, i);
            validateColumns(options.render.columns);
        }
        else if (isFlag(arg, "-n", "--interval"))
        {
            options.render.interval_seconds = parseInterval(requireValue(argc, argv, i));
        }
        else if (isFlag(arg, "-l", "--locale"))
        {
            options.render.locale = requireValue(argc, argv, i);
            if (!TimeFormat::isSupportedLocale(options.render.locale))
            {
                throw OptionsError("unsupported locale '" + options.render.locale + "'");
            }
        }
        else if (isFlag(arg, "-C", "--cache"))
        {
            options.cache_file = requireValue(argc, argv, i);
            if (options.cache_file.empty())
            {
                throw OptionsError("cache file name must not be empty");
            }
            cache_given = true;
        }
        else if (isFlag(arg, nullptr, "--no-cache"))
        {
            options.use_cache = false;
            no_cache_given = true;
        }
        else if (isFlag(arg, "-v", nullptr))
        {
            const char* value = requireValue(argc, argv, i);
            if (std::strlen(value) != 1 || value[0] < '0' || value[0] > '3')
            {
                throw OptionsError("invalid log level. Use 0-3.");
            }
            options.log_level = static_cast<LogLevel>(value[0] - '0');
        }
        else if (isFlag(arg, nullptr, "--quiet"))
        {
            options.log_level = LogLevel::NONE;
        }
        else if (isFlag(arg, nullptr, "--timestamp"))
        {
            options.show_timestamp = true;
        }
        else if (isFlag(arg, nullptr, "--log-file"))
        {
            options.log_file = requireValue(argc, argv, i);
        }
        else
        {
            throw OptionsError(std::string("unrecognized argument '") + arg + "'");
        }
    }

    if (cache_given && no_cache_given)
    {
        throw OptionsError("--cache and --no-cache are mutually exclusive");
    }
    return options;
}

void printUsage(std::ostream& out, const char* prog)
{
    out << "Usage: " << prog << " [-i <interface>] [-f <filter>] [-a] [-c <columns>] [-n <seconds>]\n"
        << "       [-l <locale>] [-C <file> | --no-cache] [-v <level>] [--quiet] [--timestamp]\n"
        << "       [--log-file <file>]\n\n"
        << "monitor Online Windows Laptops on the local network\n\n"
        << "  -i, --interface <if>  Network interface to capture on (default: any)\n"
        << "  -f, --filter <expr>   Additional packet filter in libpcap filter syntax\n"
        << "  -a                    Anonymize computer names and IP addresses\n"
        << "  -c, --columns <cols>  Columns to show (";
    bool first = true;
    for (const auto& column : viewColumns())
    {
        out << (first ? "" : ", ") << column.code << ": " << column.long_description;
        first = false;
    }
    out << "; default: " << DEFAULT_VIEW_COLUMNS << ")\n"
        << "  -n, --interval <s>    Visualization update interval in seconds (default: 2)\n"
        << "  -l, --locale <name>   Locale of the \"time ago\" column: en, it, de, fr, es (default: en)\n"
        << "  -C, --cache <file>    SQLite cache file (default: $XDG_CACHE_HOME/" << PROGRAM_NAME
        << "/" << DEFAULT_CACHE_FILENAME << ")\n"
        << "  --no-cache            Do not read or write a cache file\n"
        << "  -v <level>            Log level: 0=DEBUG, 1=INFO, 2=WARNING, 3=ERROR (default: 3)\n"
        << "  --quiet               Disable all logging\n"
        << "  --timestamp           Show timestamps in logs\n"
        << "  --log-file <file>     Append logs to a file instead of the terminal\n"
        << "  -h, --help            Show this help\n\n"
        << "press q or CTRL+C to quit\n";
}

std::string defaultCachePath()
{
    std::filesystem::path base;
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg != nullptr && xdg[0] == '/')
    {
        base = xdg;
    }
    else
    {
        const char* home = std::getenv("HOME");
        if (home == nullptr || home[0] == '\0')
        {
            throw OptionsError("cannot locate cache directory: neither XDG_CACHE_HOME nor HOME is set");
        }
        base = std::filesystem::path(home) / ".cache";
    }
    return (base / PROGRAM_NAME / DEFAULT_CACHE_FILENAME).string();
}

std::string resolveStorePath(const OwlOptions& options)
{
    if (!options.use_cache)
    {
        return SQLITE_IN_MEMORY;
    }
    if (!options.cache_file.empty())
    {
        return options.cache_file;
    }

    std::filesystem::path path = defaultCachePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
    {
        throw OptionsError("cannot create cache directory " + path.parent_path().string() +
                           ": " + ec.message());
    }
    return path.string();
}
