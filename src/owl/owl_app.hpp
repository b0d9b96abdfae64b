#ifndef OWL_APP_HPP
#define OWL_APP_HPP

#include <ostream>

#include "anonymizer.hpp"
#include "live_view_renderer.hpp"
#include "owl_options.hpp"
#include "persistence_writer.hpp"
#include "session_controller.hpp"
#include "sighting_queue.hpp"
#include "sighting_store.hpp"

// Wires capture, persistence and the live view into one interactive session.
// Detached pipeline threads keep references into this object, so it must
// outlive them; main() leaves with quick_exit instead of destroying it.
class OwlApp
{
  public:
    OwlApp(const OwlOptions& options, SightingStore& store, std::ostream& out);
    ~OwlApp() = default;

    OwlApp(const OwlApp&) = delete;
    OwlApp& operator=(const OwlApp&) = delete;

    // Blocks until the operator quits and every queued sighting is stored
    void run();

  private:
    void capture();

    OwlOptions options_;
    SightingQueue queue_;
    Anonymizer anonymizer_;
    PersistenceWriter writer_;
    LiveViewRenderer renderer_;
    SessionController session_;
};

#endif // OWL_APP_HPP
