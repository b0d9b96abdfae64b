#include "live_view_renderer.hpp"

#include <chrono>
#include <ctime>
#include <stdexcept>
#include <thread>

#include "logger.hpp"
#include "time_format.hpp"

const std::vector<ViewColumn>& viewColumns()
{
    static const std::vector<ViewColumn> columns = {
        {'n', "computer name", "computer name"},
        {'i', "IP address", "IP address"},
        {'T', "timestamp", "timestamp of last seen"},
        {'I', "last seen at", "last seen in ISO 8601 format"},
        {'A', "last seen", "last seen in \"time ago\" format"},
    };
    return columns;
}

const ViewColumn* findViewColumn(char code)
{
    for (const auto& column : viewColumns())
    {
        if (column.code == code)
        {
            return &column;
        }
    }
    return nullptr;
}

LiveViewRenderer::LiveViewRenderer(SightingStore& store, Anonymizer& anonymizer,
                                   const RenderOptions& options, std::ostream& out)
    : m_store(store), m_anonymizer(anonymizer), m_options(options), m_out(out)
{
    for (char code : m_options.columns)
    {
        if (findViewColumn(code) == nullptr)
        {
            throw std::invalid_argument(std::string("unknown column '") + code + "'");
        }
    }
}

std::vector<TableColumn> LiveViewRenderer::tableColumns() const
{
    std::vector<TableColumn> columns;
    for (char code : m_options.columns)
    {
        columns.push_back(TableColumn{findViewColumn(code)->short_description, Alignment::LEFT});
    }
    return columns;
}

std::string LiveViewRenderer::cell(char code, const LogEntry& entry, int64_t now)
{
    switch (code)
    {
        case 'n':
            return m_options.anonymize ? m_anonymizer.anonymizeName(entry.name) : entry.name;
        case 'i':
            return m_options.anonymize ? m_anonymizer.anonymizeIp(entry.ip) : entry.ip;
        case 'T':
            return std::to_string(entry.timestamp);
        case 'I':
            return TimeFormat::isoLocal(entry.timestamp);
        case 'A':
            return TimeFormat::timeAgo(entry.timestamp, now, m_options.locale);
        default:
            throw std::logic_error(std::string("unhandled column '") + code + "'");
    }
}

std::vector<std::vector<std::string>> LiveViewRenderer::buildRows(int64_t now)
{
    std::vector<LogEntry> latest = m_store.latestPerName();

    std::vector<std::vector<std::string>> rows;
    rows.reserve(latest.size());
    for (const auto& entry : latest)
    {
        std::vector<std::string> row;
        row.reserve(m_options.columns.size());
        for (char code : m_options.columns)
        {
            row.push_back(cell(code, entry, now));
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

void LiveViewRenderer::renderOnce(int64_t now)
{
    auto rows = buildRows(now);

    m_out << CLEAR_SCREEN;
    TablePrinter::print(m_out, tableColumns(), rows);
    m_out << std::flush;

    LOG_DEBUG("Rendered " << rows.size() << " hosts");
}

void LiveViewRenderer::run()
{
    LOG_INFO("Live view started, refreshing every " << m_options.interval_seconds << "s");
    while (true)
    {
        renderOnce(static_cast<int64_t>(std::time(nullptr)));
        std::this_thread::sleep_for(std::chrono::seconds(m_options.interval_seconds));
    }
}
