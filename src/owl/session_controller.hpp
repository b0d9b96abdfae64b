#ifndef SESSION_CONTROLLER_HPP
#define SESSION_CONTROLLER_HPP

#include <unistd.h>

#include <atomic>
#include <functional>
#include <thread>

#include "sighting_queue.hpp"

enum class SessionState
{
    STARTING,
    RUNNING,
    STOPPING,
    STOPPED
};

const char* sessionStateName(SessionState state);

// Long-lived pipeline roles, each run on its own thread
struct SessionTasks
{
    std::function<void()> capture;  // detached, abandoned at exit
    std::function<void()> persist;  // joined during shutdown
    std::function<void()> render;   // detached, abandoned at exit
};

/*
  Drives one interactive session on the main thread:

    STARTING  start the pipeline threads, put the input terminal in cbreak mode
    RUNNING   poll the input for 'q'/'Q' or wait for SIGINT/SIGTERM
    STOPPING  enqueue the sentinel and join the persistence thread
    STOPPED   terminal restored

  Capture and render threads are detached on purpose: they hold nothing
  that needs flushing and are terminated with the process.
*/
class SessionController
{
  public:
    static constexpr char QUIT_KEY = 'q';
    static constexpr int INPUT_POLL_TIMEOUT_MS = 100;

    explicit SessionController(SightingQueue& queue, int input_fd = STDIN_FILENO);
    ~SessionController() = default;

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Blocks until the session is STOPPED. Exceptions from the main thread
    // propagate after the persistence thread has been drained.
    void run(SessionTasks tasks);

    // Async-signal-safe
    void requestStop();

    SessionState state() const { return m_state.load(std::memory_order_acquire); }

  private:
    static void runTask(const char* role, const std::function<void()>& task);

    void setState(SessionState state);
    void waitForQuit();
    void stopPipeline(std::thread& persist_thread);

    SightingQueue& m_queue;
    int m_input_fd;
    std::atomic<bool> m_stop_requested{false};
    std::atomic<SessionState> m_state{SessionState::STARTING};
};

#endif  // SESSION_CONTROLLER_HPP
