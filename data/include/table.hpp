#pragma once

#include <string>
#include <vector>
#include <istream>
#include <ostream>
#include <optional>
#include <cstddef>

namespace data {

    // Raw tabular dataset as read from disk: header plus string cells.
    // Only the dataset validator looks at it; everything downstream works on typed records.
    struct Table {
        std::string source; // File path or label, used in error messages
        std::vector<std::string> columns;
        std::vector<std::vector<std::string>> rows;

        // Case-insensitive header lookup
        std::optional<std::size_t> columnIndex(const std::string& name) const;
        bool hasColumn(const std::string& name) const { return columnIndex(name).has_value(); }
        std::size_t rowCount() const { return rows.size(); }
    };

    // Throws core::DataLoadException on unreadable files or ragged rows
    Table readCsv(const std::string& path);
    Table parseCsv(std::istream& in, const std::string& source);

    void writeCsv(const Table& table, std::ostream& out);
    void writeCsv(const Table& table, const std::string& path);

} // namespace data
