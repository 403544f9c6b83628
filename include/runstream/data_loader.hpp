#pragma once

/// @file include/runstream/data_loader.hpp
/// @brief CSV data loader for activity streams.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV files containing activity samples into `StreamPoint`s.
/// Malformed rows are skipped and counted; the loader never crashes on bad
/// input. Range checks are left to ChannelValidator.
///
/// ## Expected CSV Format
/// ```
/// time_s,distance_m,heartrate_bpm,cadence_spm,altitude_m,velocity_mps,grade_pct
/// 0,0.0,92,160,35.0,2.8,0.0
/// 1,2.8,,160,35.0,2.8,0.0
/// ```
/// The header names the columns; `time_s` is required, the others may be
/// omitted or reordered. Empty cells are missing samples.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` on unrecoverable errors
/// - Skips individual bad rows rather than failing the entire load
/// - Does not modify any file or external state

#include "runstream/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace runstream {

struct LoadedStream {
    std::vector<StreamPoint> points;
    std::vector<Channel>     columns;       ///< Channels named in the header
    std::size_t              skipped_rows = 0;
};

class DataLoader {
public:
    /// Load samples from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Parsed samples otherwise, skipping malformed rows
    [[nodiscard]] static std::optional<LoadedStream>
    load_csv(const std::string& filepath) noexcept;

    /// Parse samples from a CSV-formatted string.
    ///
    /// A missing or unusable header (no `time_s` column) yields no points.
    [[nodiscard]] static LoadedStream
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Map a header cell to its channel, e.g. "heartrate_bpm" or "heartrate".
    [[nodiscard]] static std::optional<Channel>
    parse_column(const std::string& name) noexcept;

private:
    /// Parse one data row against the header layout.
    /// Returns `nullopt` if the row is malformed or values are non-finite.
    [[nodiscard]] static std::optional<StreamPoint>
    parse_row(const std::string& line,
              const std::vector<Channel>& layout) noexcept;
};

}  // namespace runstream
