#pragma once
// Sanity checks over an exported dataset.

#include <array>
#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace f1ar {

struct FirstMovement {
    std::size_t index = 0;
    double time = 0.0;
    std::array<double, 3> position{};
};

struct InspectionReport {
    std::string driver;
    std::array<double, 3> start_position{};
    std::optional<FirstMovement> first_movement;
};

// Scans the first telemetry entry for the first normalized position whose
// squared distance from the start exceeds threshold.
// Returns nullopt when the document has no telemetry.
// Throws std::invalid_argument when an entry is malformed.
std::optional<InspectionReport> inspect_first_movement(const nlohmann::json& document,
                                                       double threshold = 1e-6);

// Throws std::runtime_error if the file cannot be opened or parsed.
nlohmann::json load_dataset_json(const std::string& path);

} // namespace f1ar
