#ifndef SIGNAL_REGISTRY_HPP
#define SIGNAL_REGISTRY_HPP

#include <signal.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

// Routes SIGINT/SIGTERM to AppT::requestStop(), which must be
// async-signal-safe (e.g. a store to a lock-free atomic). The dispositions
// in place before registerInstance() come back on unregisterInstance().
template <typename AppT>
class SignalRegistry
{
  public:
    static void registerInstance(AppT* instance)
    {
        instance_.store(instance);
        last_signal_ = 0;

        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = &SignalRegistry::signalHandler;
        sigemptyset(&action.sa_mask);
        // no SA_RESTART: a blocked poll() should see EINTR
        action.sa_flags = 0;

        if (sigaction(SIGINT, &action, &previous_int_) != 0 ||
            sigaction(SIGTERM, &action, &previous_term_) != 0)
        {
            instance_.store(nullptr);
            throw std::runtime_error(std::string("sigaction failed: ") + std::strerror(errno));
        }
    }

    static void unregisterInstance()
    {
        sigaction(SIGINT, &previous_int_, nullptr);
        sigaction(SIGTERM, &previous_term_, nullptr);
        instance_.store(nullptr);
    }

    // Signal number that last fired while registered, 0 if none
    static int lastSignal() { return static_cast<int>(last_signal_); }

  private:
    static void signalHandler(int signum)
    {
        last_signal_ = signum;
        AppT* instance = instance_.load();
        if (instance)
            instance->requestStop();
    }

    inline static std::atomic<AppT*> instance_{nullptr};
    inline static volatile sig_atomic_t last_signal_ = 0;
    inline static struct sigaction previous_int_;
    inline static struct sigaction previous_term_;
};

#endif // SIGNAL_REGISTRY_HPP
