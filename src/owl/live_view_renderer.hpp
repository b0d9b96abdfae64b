#ifndef LIVE_VIEW_RENDERER_HPP
#define LIVE_VIEW_RENDERER_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "anonymizer.hpp"
#include "sighting_store.hpp"
#include "table_printer.hpp"

// Selectable live view columns, keyed by their one-letter code
struct ViewColumn
{
    char code;
    const char* short_description;  // table header
    const char* long_description;   // usage text
};

const std::vector<ViewColumn>& viewColumns();

// Returns the column for code, or nullptr if there is none
const ViewColumn* findViewColumn(char code);

constexpr const char* DEFAULT_VIEW_COLUMNS = "niA";

// Clears the terminal, including scrollback
constexpr const char* CLEAR_SCREEN = "\033c\033[3J";

struct RenderOptions
{
    std::string columns{DEFAULT_VIEW_COLUMNS};
    bool anonymize{false};
    std::string locale{"en"};
    unsigned interval_seconds{2};
};

// Periodically draws the latest sighting per host as a table
class LiveViewRenderer
{
   public:
    LiveViewRenderer(SightingStore& store, Anonymizer& anonymizer, const RenderOptions& options,
                     std::ostream& out);
    ~LiveViewRenderer() = default;

    // Never returns; a store failure propagates to the caller
    [[noreturn]] void run();

    // One refresh cycle relative to now (epoch seconds)
    void renderOnce(int64_t now);

    // Table cells for the current store contents, one row per host
    std::vector<std::vector<std::string>> buildRows(int64_t now);

    std::vector<TableColumn> tableColumns() const;

   private:
    std::string cell(char code, const LogEntry& entry, int64_t now);

    SightingStore& m_store;
    Anonymizer& m_anonymizer;
    RenderOptions m_options;
    std::ostream& m_out;
};

#endif  // LIVE_VIEW_RENDERER_HPP
