#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "logger.hpp"
#include "owl_app.hpp"
#include "owl_options.hpp"
#include "sqlite_sighting_store.hpp"

// Leaves without running destructors: the capture and live view threads are
// detached and may still be using the store and the app.
[[noreturn]] static void terminate_process(int status)
{
    std::cout << std::flush;
    std::cerr << std::flush;
    std::quick_exit(status);
}

int main(int argc, char** argv)
{
    OwlOptions options;
    std::string store_path;
    try
    {
        options = parseOptions(argc, argv);
        if (options.show_help)
        {
            printUsage(std::cout, argv[0]);
            return 0;
        }
        store_path = resolveStorePath(options);
    }
    catch (const OptionsError& e)
    {
        std::cerr << argv[0] << ": error: " << e.what() << "\n";
        printUsage(std::cerr, argv[0]);
        return 1;
    }

    // Configure logger
    Logger::setLevel(options.log_level);
    Logger::setShowTimestamp(options.show_timestamp);
    if (!options.log_file.empty() && !Logger::setOutputFile(options.log_file))
    {
        std::cerr << argv[0] << ": error: cannot open log file " << options.log_file << "\n";
        return 1;
    }

    LOG_INFO("owl starting...");
    LOG_INFO("Interface: " << options.interface);
    LOG_INFO("Filter: " << (options.filter.empty() ? "(none)" : options.filter));
    LOG_INFO("Store: " << store_path);
    LOG_DEBUG("Log level: " << static_cast<int>(options.log_level));

    std::unique_ptr<SqliteSightingStore> store;
    std::unique_ptr<OwlApp> app;
    try
    {
        store = std::make_unique<SqliteSightingStore>(store_path);
        app = std::make_unique<OwlApp>(options, *store, std::cout);
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Startup failed: " << e.what());
        std::cerr << argv[0] << ": error: " << e.what() << "\n";
        return 1;
    }

    int status = 0;
    try
    {
        app->run();
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("Session failed: " << e.what());
        status = 1;
    }

    LOG_INFO("owl stopped");
    terminate_process(status);
}
