#include "f1ar/dataset_inspector.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

namespace f1ar {
namespace {

double to_number(const nlohmann::json& value, const char* what) {
    if (!value.is_number()) {
        throw std::invalid_argument(std::string(what) + " must be a number, got " + value.dump());
    }
    return value.get<double>();
}

std::array<double, 3> to_point(const nlohmann::json& value) {
    if (!value.is_array() || value.size() != 3) {
        throw std::invalid_argument("Position entry must be an array of 3 numbers.");
    }
    return {to_number(value[0], "Position component"), to_number(value[1], "Position component"),
            to_number(value[2], "Position component")};
}

double squared_distance(const std::array<double, 3>& a, const std::array<double, 3>& b) {
    double sum = 0.0;
    for (std::size_t i = 0; i < 3; ++i) {
        const double d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

} // namespace

std::optional<InspectionReport> inspect_first_movement(const nlohmann::json& document, double threshold) {
    const auto telemetry = document.find("telemetry");
    if (telemetry == document.end() || !telemetry->is_array() || telemetry->empty()) {
        return std::nullopt;
    }

    const auto& first_car = telemetry->front();
    const auto positions = first_car.find("positions_normalized");
    const auto times = first_car.find("times");
    if (positions == first_car.end() || times == first_car.end() || !positions->is_array() ||
        !times->is_array()) {
        throw std::invalid_argument("Telemetry entry lacks positions_normalized or times.");
    }
    if (positions->empty()) {
        throw std::invalid_argument("Telemetry entry has no positions.");
    }
    if (positions->size() != times->size()) {
        throw std::invalid_argument("Telemetry entry has mismatched positions and times.");
    }

    InspectionReport report;
    report.driver = first_car.value("driver", "");
    report.start_position = to_point(positions->front());

    for (std::size_t i = 0; i < positions->size(); ++i) {
        const auto point = to_point((*positions)[i]);
        if (squared_distance(point, report.start_position) > threshold) {
            report.first_movement = FirstMovement{i, to_number((*times)[i], "Time"), point};
            break;
        }
    }
    return report;
}

nlohmann::json load_dataset_json(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open dataset: " + path);
    }
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse dataset " + path + ": " + e.what());
    }
}

} // namespace f1ar
