#pragma once

/// @file include/seqa/data_loader.hpp
/// @brief CSV loader producing raw records for the EventNormalizer.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Read a header-first CSV file into `ingest::RawRecord`s, one per data row,
/// keyed by the header's column names. Cells stay text; typing and
/// validation belong to the normalizer.
///
/// ## Format
/// ```
/// white,black,winner,end_time
/// Hikaru,MagnusCarlsen,Hikaru,2024-01-02T18:00:00
/// "Botez, Alexandra",GothamChess,,2024-01-03
/// ```
///   - First non-blank, non-comment line is the header
///   - Lines starting with '#' and blank lines are skipped
///   - Double-quoted cells may contain commas; `""` is a literal quote
///   - Empty cells and missing trailing cells are NULL
///   - Cells beyond the header width are ignored
///   - A repeated header name maps to its first column; later ones are ignored
///
/// ## Guarantees
/// - Never throws; `load_csv` returns `nullopt` if the file cannot be opened
/// - Does not modify any file or external state

#include "seqa/normalizer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace seqa::core {

class DataLoader {
public:
    /// Load every data row of a CSV file.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector for an empty or header-only file
    [[nodiscard]] static std::optional<std::vector<ingest::RawRecord>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse CSV text (same format as `load_csv`).
    [[nodiscard]] static std::vector<ingest::RawRecord>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Split one CSV line into trimmed cells, honoring double quotes.
    [[nodiscard]] static std::vector<std::string>
    split_row(const std::string& line);
};

}  // namespace seqa::core
