/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for activity streams.

#include "runstream/data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace runstream {

namespace {

std::string trim(const std::string& token) {
    const auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = token.find_last_not_of(" \t\r\n");
    return token.substr(first, last - first + 1);
}

/// 2^63: the first double past the int64 range.
constexpr double TIME_LIMIT_S = 9223372036854775808.0;

bool fits_time(double value) noexcept {
    return std::floor(value) == value && value >= -TIME_LIMIT_S && value < TIME_LIMIT_S;
}

std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> cells;
    std::istringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        cells.push_back(trim(token));
    }
    // A trailing comma leaves one empty cell that getline drops.
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

/// Parse a numeric cell. Empty cells are `nullopt` with `ok` left true.
std::optional<double> parse_cell(const std::string& cell, bool& ok) noexcept {
    if (cell.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        const double val = std::stod(cell, &pos);
        if (pos != cell.size() || !std::isfinite(val)) {
            ok = false;
            return std::nullopt;
        }
        return val;
    } catch (const std::exception&) {
        ok = false;
        return std::nullopt;
    }
}

}  // namespace

// ─── DataLoader::parse_column ─────────────────────────────────────────────────

std::optional<Channel> DataLoader::parse_column(const std::string& name) noexcept {
    std::string key = trim(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "time_s" || key == "time")                        return Channel::Time;
    if (key == "distance_m" || key == "distance")                return Channel::Distance;
    if (key == "heartrate_bpm" || key == "heartrate" || key == "hr") return Channel::Heartrate;
    if (key == "cadence_spm" || key == "cadence")                return Channel::Cadence;
    if (key == "altitude_m" || key == "altitude")                return Channel::Altitude;
    if (key == "velocity_mps" || key == "velocity" || key == "velocity_smooth") return Channel::Velocity;
    if (key == "grade_pct" || key == "grade" || key == "grade_smooth") return Channel::Grade;
    return std::nullopt;
}

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<StreamPoint>
DataLoader::parse_row(const std::string& line,
                      const std::vector<Channel>& layout) noexcept {
    // Skip blank lines and comment lines.
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    const auto cells = split_row(line);
    if (cells.size() != layout.size()) {
        return std::nullopt;
    }

    StreamPoint point{.time_s = 0};
    bool has_time = false;
    bool ok = true;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        const auto value = parse_cell(cells[i], ok);
        if (!ok) return std::nullopt;

        switch (layout[i]) {
            case Channel::Time:
                if (!value || !fits_time(*value)) return std::nullopt;
                point.time_s = static_cast<std::int64_t>(*value);
                has_time = true;
                break;
            case Channel::Distance:  point.distance_m    = value; break;
            case Channel::Heartrate: point.heartrate_bpm = value; break;
            case Channel::Cadence:   point.cadence_spm   = value; break;
            case Channel::Altitude:  point.altitude_m    = value; break;
            case Channel::Velocity:  point.velocity_mps  = value; break;
            case Channel::Grade:     point.grade_pct     = value; break;
        }
    }

    if (!has_time) {
        return std::nullopt;
    }
    return point;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

LoadedStream DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    LoadedStream loaded;
    std::istringstream stream(csv_content);
    std::string line;
    std::optional<std::vector<Channel>> layout;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (!layout) {
            // First non-empty, non-comment line is the header.
            std::vector<Channel> columns;
            for (const auto& cell : split_row(line)) {
                const auto channel = parse_column(cell);
                if (!channel || std::find(columns.begin(), columns.end(), *channel) != columns.end()) {
                    return loaded;
                }
                columns.push_back(*channel);
            }
            if (std::find(columns.begin(), columns.end(), Channel::Time) == columns.end()) {
                return loaded;
            }
            loaded.columns = columns;
            layout = std::move(columns);
            continue;
        }

        auto point = parse_row(line, *layout);
        if (point) {
            loaded.points.push_back(*point);
        } else {
            ++loaded.skipped_rows;
        }
    }

    return loaded;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<LoadedStream>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string contents;
    std::string line;
    while (std::getline(file, line)) {
        contents += line;
        contents += '\n';
    }

    return parse_csv_string(contents);
}

}  // namespace runstream
