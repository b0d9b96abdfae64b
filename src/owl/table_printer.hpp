#ifndef TABLE_PRINTER_HPP
#define TABLE_PRINTER_HPP

#include <ostream>
#include <string>
#include <vector>

enum class Alignment
{
    LEFT,
    RIGHT
};

struct TableColumn
{
    std::string header;
    Alignment alignment{Alignment::LEFT};
};

// Plain-text table: header, dashed separator, one line per row.
// Each row must have one cell per column.
class TablePrinter
{
   public:
    static void print(std::ostream& out, const std::vector<TableColumn>& columns,
                      const std::vector<std::vector<std::string>>& rows);
};

#endif  // TABLE_PRINTER_HPP
