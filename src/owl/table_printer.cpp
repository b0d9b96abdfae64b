#include "table_printer.hpp"

#include <algorithm>
#include <iomanip>
#include <stdexcept>

static void printCell(std::ostream& out, const std::string& text, const TableColumn& column,
                      size_t width)
{
    out << (column.alignment == Alignment::RIGHT ? std::right : std::left)
        << std::setw(static_cast<int>(width)) << text;
}

void TablePrinter::print(std::ostream& out, const std::vector<TableColumn>& columns,
                         const std::vector<std::vector<std::string>>& rows)
{
    // Column width = longest of header and cells
    std::vector<size_t> widths;
    widths.reserve(columns.size());
    for (const auto& column : columns)
    {
        widths.push_back(column.header.size());
    }
    for (const auto& row : rows)
    {
        if (row.size() != columns.size())
        {
            throw std::invalid_argument("table row has " + std::to_string(row.size()) +
                                        " cells, expected " + std::to_string(columns.size()));
        }
        for (size_t i = 0; i < row.size(); ++i)
        {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    for (size_t i = 0; i < columns.size(); ++i)
    {
        if (i > 0)
        {
            out << " | ";
        }
        printCell(out, columns[i].header, columns[i], widths[i]);
    }
    out << "\n";

    for (size_t i = 0; i < columns.size(); ++i)
    {
        if (i > 0)
        {
            out << "-+-";
        }
        out << std::string(widths[i], '-');
    }
    out << "\n";

    for (const auto& row : rows)
    {
        for (size_t i = 0; i < row.size(); ++i)
        {
            if (i > 0)
            {
                out << " | ";
            }
            printCell(out, row[i], columns[i], widths[i]);
        }
        out << "\n";
    }
    out << std::left;
}
