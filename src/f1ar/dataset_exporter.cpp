#include "f1ar/dataset_exporter.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include "f1ar/logger.hpp"

namespace f1ar {
namespace {

using json = nlohmann::ordered_json;

json rows_to_json(const Eigen::MatrixXd& points) {
    json out = json::array();
    for (Eigen::Index i = 0; i < points.rows(); ++i) {
        out.push_back({points(i, 0), points(i, 1), points(i, 2)});
    }
    return out;
}

json vector_to_json(const Eigen::Vector3d& v) {
    return json::array({v.x(), v.y(), v.z()});
}

json coordinate_system() {
    json system;
    system["description"] = "Normalized to -0.5 to 0.5 range, centered at (0,0,0) for AR placement";
    system["range"] = "[-0.5, 0.5] for each axis";
    system["mapping"] = {
        {"f1_x", "threejs_x"},
        {"f1_y", "threejs_z (depth)"},
        {"f1_z", "threejs_y (height)"},
    };
    return system;
}

} // namespace

DatasetExporter::DatasetExporter(const ExportConfig& config) : config_(config) {}

std::string DatasetExporter::output_filename(const SessionMetadata& metadata) {
    std::ostringstream name;
    name << "race_data_" << metadata.year << "_" << metadata.grand_prix << "_" << metadata.session_type
         << ".json";
    return name.str();
}

nlohmann::ordered_json DatasetExporter::to_json(const RaceDataset& dataset) const {
    const auto& meta = dataset.metadata;

    json metadata;
    metadata["year"] = meta.year;
    metadata["grand_prix"] = meta.grand_prix;
    metadata["session_type"] = meta.session_type;
    metadata["session_name"] = meta.session_name;
    metadata["event_date"] = meta.event_date;
    metadata["total_laps"] = meta.total_laps.has_value() ? json(*meta.total_laps) : json(nullptr);
    metadata["track_length_km"] =
        meta.track_length_km.has_value() ? json(*meta.track_length_km) : json(nullptr);
    metadata["num_drivers"] = dataset.tracks.size();
    metadata["coordinate_bounds"] = {
        {"min", vector_to_json(dataset.bounds.min)},
        {"max", vector_to_json(dataset.bounds.max)},
        {"ranges", vector_to_json(dataset.bounds.range)},
    };
    metadata["coordinate_system"] = coordinate_system();

    json drivers = json::object();
    for (const auto& driver : dataset.roster) {
        drivers[driver.id] = {
            {"number", driver.id},
            {"name", driver.full_name},
            {"abbreviation", driver.abbreviation},
            {"team", driver.team_name},
        };
    }

    json track;
    track["path"] = rows_to_json(dataset.track_path);
    track["description"] = dataset.track_description;

    json telemetry = json::array();
    for (const auto& entry : dataset.tracks) {
        json car;
        car["driver"] = entry.driver.id;
        car["positions"] = rows_to_json(entry.source_positions);
        car["times"] = entry.times;
        car["throttle"] = entry.throttle;
        car["brake"] = entry.brake;
        car["speed"] = entry.speed;
        car["positions_normalized"] = rows_to_json(entry.positions_normalized);
        telemetry.push_back(std::move(car));
    }

    json doc;
    doc["metadata"] = std::move(metadata);
    doc["drivers"] = std::move(drivers);
    doc["track"] = std::move(track);
    doc["telemetry"] = std::move(telemetry);
    return doc;
}

std::filesystem::path DatasetExporter::write(const RaceDataset& dataset) const {
    const std::filesystem::path dir(config_.output_dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create output directory " + dir.string() + ": " + ec.message());
    }

    const auto path = dir / output_filename(dataset.metadata);
    Logger::log(LogLevel::Info, "Saving to " + path.string());

    // Serialize before opening so a failure leaves any previous file intact.
    std::string text;
    try {
        text = to_json(dataset).dump(config_.indent);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to serialize dataset: " + std::string(e.what()));
    }

    {
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Failed to open output file: " + path.string());
        }
        out << text;
        if (!out) {
            throw std::runtime_error("Failed to write output file: " + path.string());
        }
    }

    const auto bytes = std::filesystem::file_size(path, ec);
    if (!ec) {
        std::ostringstream size;
        size << std::fixed << std::setprecision(2) << "Saved, file size: "
             << static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB";
        Logger::log(LogLevel::Info, size.str());
    }
    return path;
}

} // namespace f1ar
