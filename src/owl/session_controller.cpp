#include "session_controller.hpp"

#include <poll.h>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>

#include "logger.hpp"
#include "signal_registry.hpp"
#include "terminal_mode_guard.hpp"

const char* sessionStateName(SessionState state)
{
    switch (state)
    {
        case SessionState::STARTING: return "STARTING";
        case SessionState::RUNNING:  return "RUNNING";
        case SessionState::STOPPING: return "STOPPING";
        case SessionState::STOPPED:  return "STOPPED";
    }
    return "UNKNOWN";
}

SessionController::SessionController(SightingQueue& queue, int input_fd)
    : m_queue(queue), m_input_fd(input_fd)
{
}

void SessionController::requestStop()
{
    m_stop_requested.store(true, std::memory_order_release);
}

void SessionController::setState(SessionState state)
{
    m_state.store(state, std::memory_order_release);
    LOG_INFO("Session " << sessionStateName(state));
}

void SessionController::runTask(const char* role, const std::function<void()>& task)
{
    Logger::setThreadRole(role);
    // A failure ends this role only; the other threads keep running
    try
    {
        task();
        LOG_INFO("The " << role << " thread finished");
    }
    catch (const std::exception& e)
    {
        LOG_ERROR("The " << role << " thread stopped: " << e.what());
    }
}

void SessionController::run(SessionTasks tasks)
{
    Logger::setThreadRole("main");
    setState(SessionState::STARTING);

    std::thread persist_thread(&SessionController::runTask, "persistence", std::move(tasks.persist));
    std::thread(&SessionController::runTask, "capture", std::move(tasks.capture)).detach();
    std::thread(&SessionController::runTask, "live view", std::move(tasks.render)).detach();

    try
    {
        SignalRegistry<SessionController>::registerInstance(this);
        TerminalModeGuard guard(m_input_fd);
        setState(SessionState::RUNNING);
        waitForQuit();
        stopPipeline(persist_thread);
    }
    catch (...)
    {
        SignalRegistry<SessionController>::unregisterInstance();
        if (persist_thread.joinable())
        {
            stopPipeline(persist_thread);
        }
        setState(SessionState::STOPPED);
        throw;
    }
    SignalRegistry<SessionController>::unregisterInstance();
    setState(SessionState::STOPPED);
}

void SessionController::waitForQuit()
{
    bool input_open = true;
    while (!m_stop_requested.load(std::memory_order_acquire))
    {
        if (!input_open)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(INPUT_POLL_TIMEOUT_MS));
            continue;
        }

        struct pollfd pfd;
        pfd.fd = m_input_fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = poll(&pfd, 1, INPUT_POLL_TIMEOUT_MS);
        if (rc < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw std::runtime_error(std::string("poll on input failed: ") + std::strerror(errno));
        }
        if (rc == 0)
        {
            continue;
        }

        char key = 0;
        ssize_t n = read(m_input_fd, &key, 1);
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
            {
                continue;
            }
            throw std::runtime_error(std::string("read on input failed: ") + std::strerror(errno));
        }
        if (n == 0)
        {
            // Only signals can stop the session from now on
            LOG_INFO("Input closed, press CTRL+C to quit");
            input_open = false;
            continue;
        }
        if (std::tolower(static_cast<unsigned char>(key)) == QUIT_KEY)
        {
            LOG_INFO("Quit key pressed");
            return;
        }
    }
    LOG_INFO("Stop requested by signal " << SignalRegistry<SessionController>::lastSignal());
}

void SessionController::stopPipeline(std::thread& persist_thread)
{
    setState(SessionState::STOPPING);
    m_queue.putSentinel();
    // No timeout: a stuck storage write blocks shutdown
    persist_thread.join();
}
