#ifndef TERMINAL_MODE_GUARD_HPP
#define TERMINAL_MODE_GUARD_HPP

#include <termios.h>

#include <exception>

/*
  Puts a terminal into cbreak mode (no line buffering, no echo, signals
  still generated) for the lifetime of the object and restores the original
  attributes on destruction.

  While a guard is active, an uncaught exception in any thread also restores
  the terminal before the process aborts.

  A descriptor that is not a terminal is left untouched.
*/
class TerminalModeGuard
{
   public:
    explicit TerminalModeGuard(int fd);
    ~TerminalModeGuard();

    TerminalModeGuard(const TerminalModeGuard&) = delete;
    TerminalModeGuard& operator=(const TerminalModeGuard&) = delete;

   private:
    static void restoreOnTerminate();

    int m_fd;
    bool m_active{false};
    struct termios m_original;
    std::terminate_handler m_previous_terminate{nullptr};
};

#endif  // TERMINAL_MODE_GUARD_HPP
