#include "owl_app.hpp"

#include <stdexcept>
#include <utility>

#include "announcement_decoder.hpp"
#include "capture_engine.hpp"
#include "logger.hpp"

OwlApp::OwlApp(const OwlOptions& options, SightingStore& store, std::ostream& out)
    : options_(options),
      writer_(queue_, store),
      renderer_(store, anonymizer_, options.render, out),
      session_(queue_)
{
}

void OwlApp::capture()
{
    // Opening the interface happens here so that a capture fault stops
    // only this thread; the live view keeps showing what is stored.
    CaptureEngine engine(options_.interface);
    if (!engine.setFilter(options_.filter))
    {
        throw std::runtime_error("capture filter rejected: '" + options_.filter + "'");
    }

    AnnouncementDecoder decoder(queue_, engine.linkType());
    engine.run(decoder);
}

void OwlApp::run()
{
    SessionTasks tasks;
    tasks.capture = [this] { capture(); };
    tasks.persist = [this] { writer_.run(); };
    tasks.render = [this] { renderer_.run(); };

    session_.run(std::move(tasks));

    LOG_INFO("Session ended, " << writer_.writtenCount() << " sightings stored");
}
