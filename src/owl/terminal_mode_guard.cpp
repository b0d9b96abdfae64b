#include "terminal_mode_guard.hpp"

#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

#include "logger.hpp"

// Read by the terminate hook, which may run on any thread
static std::atomic<int> g_guarded_fd{-1};
static struct termios g_guarded_original;
static std::terminate_handler g_chained_terminate = nullptr;

TerminalModeGuard::TerminalModeGuard(int fd) : m_fd(fd)
{
    if (!isatty(m_fd))
    {
        LOG_INFO("Input is not a terminal, leaving its mode unchanged");
        return;
    }

    if (tcgetattr(m_fd, &m_original) != 0)
    {
        throw std::runtime_error(std::string("tcgetattr failed: ") + std::strerror(errno));
    }

    struct termios cbreak = m_original;
    cbreak.c_lflag &= ~(ICANON | ECHO);
    cbreak.c_cc[VMIN] = 1;
    cbreak.c_cc[VTIME] = 0;
    if (tcsetattr(m_fd, TCSAFLUSH, &cbreak) != 0)
    {
        throw std::runtime_error(std::string("tcsetattr failed: ") + std::strerror(errno));
    }
    m_active = true;

    g_guarded_original = m_original;
    g_guarded_fd.store(m_fd, std::memory_order_release);
    m_previous_terminate = std::set_terminate(&TerminalModeGuard::restoreOnTerminate);
    g_chained_terminate = m_previous_terminate;

    LOG_DEBUG("Terminal " << m_fd << " switched to cbreak mode");
}

TerminalModeGuard::~TerminalModeGuard()
{
    if (!m_active)
    {
        return;
    }

    std::set_terminate(m_previous_terminate);
    g_guarded_fd.store(-1, std::memory_order_release);

    if (tcsetattr(m_fd, TCSADRAIN, &m_original) != 0)
    {
        LOG_ERROR("Failed to restore terminal mode: " << std::strerror(errno));
        return;
    }
    LOG_DEBUG("Terminal " << m_fd << " mode restored");
}

void TerminalModeGuard::restoreOnTerminate()
{
    int fd = g_guarded_fd.exchange(-1, std::memory_order_acq_rel);
    if (fd >= 0)
    {
        tcsetattr(fd, TCSADRAIN, &g_guarded_original);
    }
    if (g_chained_terminate != nullptr)
    {
        g_chained_terminate();
    }
    std::abort();
}
