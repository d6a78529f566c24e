#include "f1ar/cached_session_source.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "f1ar/errors.hpp"
#include "f1ar/logger.hpp"

namespace f1ar {
namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> cols;
    std::string cur;
    for (const char c : line) {
        if (c == ',') {
            cols.push_back(trim(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    cols.push_back(trim(cur));
    return cols;
}

std::optional<double> parse_cell(const std::string& cell) {
    if (cell.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const auto lower = to_lower(cell);
    if (lower == "true") {
        return 1.0;
    }
    if (lower == "false") {
        return 0.0;
    }
    try {
        std::size_t idx = 0;
        const double v = std::stod(cell, &idx);
        if (idx != cell.size()) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

struct CsvColumn {
    std::string name;
    std::vector<std::string> cells;
};

std::string driver_field(const YAML::Node& node, const char* key, const std::string& fallback) {
    const auto value = node[key].as<std::string>("");
    return value.empty() ? fallback : value;
}

} // namespace

ChannelSeries read_channel_csv(std::istream& in) {
    std::vector<CsvColumn> columns;
    std::string line;
    std::size_t line_number = 0;
    bool header_consumed = false;

    while (std::getline(in, line)) {
        ++line_number;
        const std::string raw = trim(line);
        if (raw.empty() || raw[0] == '#') {
            continue;
        }

        const auto cols = split_csv_line(raw);
        if (!header_consumed) {
            for (const auto& name : cols) {
                columns.push_back(CsvColumn{name, {}});
            }
            header_consumed = true;
            continue;
        }

        if (cols.size() != columns.size()) {
            std::ostringstream oss;
            oss << "CSV line " << line_number << " has " << cols.size() << " fields, expected "
                << columns.size();
            throw std::invalid_argument(oss.str());
        }
        for (std::size_t i = 0; i < cols.size(); ++i) {
            columns[i].cells.push_back(cols[i]);
        }
    }

    if (!header_consumed) {
        throw std::invalid_argument("CSV input has no header row.");
    }

    ChannelSeries series;
    for (const auto& column : columns) {
        if (column.name.empty()) {
            continue;
        }

        if (column.name == channel::kSessionTime) {
            std::vector<SessionDuration> axis;
            axis.reserve(column.cells.size());
            try {
                for (const auto& cell : column.cells) {
                    axis.push_back(parse_session_duration(cell));
                }
            } catch (const std::invalid_argument& e) {
                Logger::log(LogLevel::Debug, std::string("Dropping SessionTime column: ") + e.what());
                continue;
            }
            series.session_time = std::move(axis);
            continue;
        }

        std::vector<double> values;
        values.reserve(column.cells.size());
        bool numeric = true;
        for (const auto& cell : column.cells) {
            const auto value = parse_cell(cell);
            if (!value.has_value()) {
                numeric = false;
                break;
            }
            values.push_back(*value);
        }
        if (!numeric) {
            Logger::log(LogLevel::Debug, "Dropping non-numeric column " + column.name);
            continue;
        }
        series.channels[column.name] = std::move(values);
    }

    return series;
}

CachedSessionSource::CachedSessionSource(const PipelineConfig& config)
    : session_(config.session),
      session_dir_(std::filesystem::path(config.source.cache_dir) / std::to_string(config.session.year) /
                   config.session.grand_prix / config.session.session_type) {
    std::error_code ec;
    std::filesystem::create_directories(config.source.cache_dir, ec);
    if (ec) {
        Logger::log(LogLevel::Warn, "Failed to create cache directory " + config.source.cache_dir + ": " +
                                        ec.message());
    }
}

SessionInfo CachedSessionSource::load_session() {
    const auto path = session_dir_ / "session.yaml";

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        throw SourceUnavailableError("Session not found in cache: " + path.string());
    } catch (const YAML::Exception& e) {
        throw SourceUnavailableError("Failed to parse " + path.string() + ": " + e.what());
    }

    SessionInfo info;
    try {
        info.metadata.year = session_.year;
        info.metadata.grand_prix = session_.grand_prix;
        info.metadata.session_type = session_.session_type;
        info.metadata.session_name = root["name"].as<std::string>(session_.session_type);
        info.metadata.event_date = root["date"].as<std::string>("");
        if (root["total_laps"] && !root["total_laps"].IsNull()) {
            info.metadata.total_laps = root["total_laps"].as<int>();
        }
        if (root["track_length_km"] && !root["track_length_km"].IsNull()) {
            info.metadata.track_length_km = root["track_length_km"].as<double>();
        }

        for (const auto& node : root["drivers"]) {
            const auto number = node["number"].as<std::string>();
            DriverInfo driver;
            driver.id = number;
            driver.full_name = driver_field(node, "full_name", "Driver " + number);
            driver.abbreviation = driver_field(node, "abbreviation", number);
            driver.team_name = driver_field(node, "team_name", "Unknown");
            info.drivers.push_back(std::move(driver));
        }
    } catch (const YAML::Exception& e) {
        throw SourceUnavailableError("Malformed session metadata in " + path.string() + ": " + e.what());
    }

    return info;
}

ChannelSeries CachedSessionSource::position_data(const std::string& driver_id) {
    const auto path = session_dir_ / "position_data" / (driver_id + ".csv");
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("No position data for driver " + driver_id + " at " + path.string());
    }
    return read_channel_csv(in);
}

ChannelSeries CachedSessionSource::car_data(const std::string& driver_id) {
    const auto path = session_dir_ / "car_data" / (driver_id + ".csv");
    std::ifstream in(path);
    if (!in.is_open()) {
        Logger::log(LogLevel::Debug, "No car data for driver " + driver_id);
        return ChannelSeries{};
    }
    return read_channel_csv(in);
}

} // namespace f1ar
