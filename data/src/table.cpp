#include "table.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <sstream>

namespace data {

    namespace {

        // Splits one CSV record. Double-quoted fields may contain commas and "" escapes.
        std::vector<std::string> splitRecord(const std::string& line, std::size_t line_number, const std::string& source) {
            std::vector<std::string> fields;
            std::string current;
            bool in_quotes = false;
            for (std::size_t i = 0; i < line.size(); ++i) {
                const char c = line[i];
                if (in_quotes) {
                    if (c == '"') {
                        if (i + 1 < line.size() && line[i + 1] == '"') {
                            current += '"';
                            ++i;
                        } else {
                            in_quotes = false;
                        }
                    } else {
                        current += c;
                    }
                } else if (c == '"') {
                    in_quotes = true;
                } else if (c == ',') {
                    fields.push_back(core::utils::trim(current));
                    current.clear();
                } else {
                    current += c;
                }
            }
            if (in_quotes) {
                throw core::DataLoadException(fmt::format("{}:{}: unterminated quoted field", source, line_number));
            }
            fields.push_back(core::utils::trim(current));
            return fields;
        }

        std::string quoteIfNeeded(const std::string& cell) {
            if (cell.find_first_of(",\"\n") == std::string::npos) return cell;
            std::string quoted = "\"";
            for (char c : cell) {
                if (c == '"') quoted += '"';
                quoted += c;
            }
            quoted += '"';
            return quoted;
        }

    } // end anonymous namespace

    std::optional<std::size_t> Table::columnIndex(const std::string& name) const {
        const std::string wanted = core::utils::toLower(name);
        for (std::size_t i = 0; i < columns.size(); ++i) {
            if (core::utils::toLower(columns[i]) == wanted) return i;
        }
        return std::nullopt;
    }

    Table parseCsv(std::istream& in, const std::string& source) {
        auto logger = core::logging::getLogger();
        Table table;
        table.source = source;

        std::string line;
        std::size_t line_number = 0;
        bool have_header = false;
        while (std::getline(in, line)) {
            ++line_number;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (core::utils::trim(line).empty()) continue; // Skip blank lines

            auto fields = splitRecord(line, line_number, source);
            if (!have_header) {
                // Strip a UTF-8 byte order mark from the first header cell
                if (!fields.empty() && fields[0].rfind("\xEF\xBB\xBF", 0) == 0) {
                    fields[0] = fields[0].substr(3);
                }
                table.columns = std::move(fields);
                have_header = true;
                continue;
            }
            if (fields.size() != table.columns.size()) {
                throw core::DataLoadException(fmt::format("{}:{}: expected {} fields but found {}",
                                                          source, line_number, table.columns.size(), fields.size()));
            }
            table.rows.push_back(std::move(fields));
        }

        if (!have_header) {
            throw core::DataLoadException(fmt::format("{}: dataset is empty (no header row)", source));
        }
        logger->debug("Parsed {} rows x {} columns from {}", table.rows.size(), table.columns.size(), source);
        return table;
    }

    Table readCsv(const std::string& path) {
        core::logging::getLogger()->info("Reading CSV dataset: {}", path);
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::DataLoadException(fmt::format("Failed to open CSV file: {}", path));
        }
        return parseCsv(ifs, path);
    }

    void writeCsv(const Table& table, std::ostream& out) {
        for (std::size_t i = 0; i < table.columns.size(); ++i) {
            if (i > 0) out << ',';
            out << quoteIfNeeded(table.columns[i]);
        }
        out << '\n';
        for (const auto& row : table.rows) {
            for (std::size_t i = 0; i < row.size(); ++i) {
                if (i > 0) out << ',';
                out << quoteIfNeeded(row[i]);
            }
            out << '\n';
        }
    }

    void writeCsv(const Table& table, const std::string& path) {
        std::ofstream ofs(path, std::ios::out | std::ios::trunc);
        if (!ofs.is_open()) {
            throw core::DataLoadException(fmt::format("Failed to open output file for writing: {}", path));
        }
        writeCsv(table, ofs);
        if (!ofs) {
            throw core::DataLoadException(fmt::format("Failed while writing output file: {}", path));
        }
        core::logging::getLogger()->info("Wrote {} rows to {}", table.rows.size(), path);
    }

} // namespace data
