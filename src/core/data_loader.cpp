/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader producing ingest::RawRecord rows.

#include "seqa/data_loader.hpp"

#include <fstream>
#include <sstream>
#include <string>

namespace seqa::core {

namespace {

[[nodiscard]] std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

[[nodiscard]] bool skippable(const std::string& line) {
    const auto first = line.find_first_not_of(" \t\r\n");
    return first == std::string::npos || line[first] == '#';
}

}  // namespace

// ─── DataLoader::split_row ────────────────────────────────────────────────────

std::vector<std::string> DataLoader::split_row(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;   // inside a quoted section
    bool was_quoted = false;  // cell had quotes: keep inner whitespace

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell += '"';  // escaped quote
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                cell += c;
            }
            continue;
        }
        if (c == '"') {
            quoted = true;
            was_quoted = true;
        } else if (c == ',') {
            cells.push_back(was_quoted ? cell : trim(cell));
            cell.clear();
            was_quoted = false;
        } else {
            cell += c;
        }
    }
    cells.push_back(was_quoted ? cell : trim(cell));
    return cells;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

std::vector<ingest::RawRecord>
DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::vector<ingest::RawRecord> records;
    std::istringstream stream(csv_content);
    std::string line;
    std::vector<std::string> header;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (skippable(line)) {
            continue;
        }

        if (header.empty()) {
            header = split_row(line);
            continue;
        }

        const auto cells = split_row(line);
        ingest::RawRecord record;
        record.reserve(header.size());
        // emplace keeps the first column of a repeated header name.
        for (std::size_t c = 0; c < header.size(); ++c) {
            if (c < cells.size() && !cells[c].empty()) {
                record.emplace(header[c], cells[c]);
            } else {
                record.emplace(header[c], std::monostate{});
            }
        }
        records.push_back(std::move(record));
    }

    return records;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<std::vector<ingest::RawRecord>>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace seqa::core
