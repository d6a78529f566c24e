#pragma once
// Writing the assembled dataset as the JSON artifact read by the AR front end.

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "f1ar/config.hpp"
#include "f1ar/telemetry_types.hpp"

namespace f1ar {

class DatasetExporter {
public:
    explicit DatasetExporter(const ExportConfig& config);

    nlohmann::ordered_json to_json(const RaceDataset& dataset) const;

    // Creates the output directory if needed and returns the written path.
    // Throws std::runtime_error if the dataset cannot be serialized or the
    // directory or file cannot be written. A serialization failure leaves an
    // existing file untouched.
    std::filesystem::path write(const RaceDataset& dataset) const;

    // race_data_{year}_{grand_prix}_{session_type}.json
    static std::string output_filename(const SessionMetadata& metadata);

private:
    ExportConfig config_;
};

} // namespace f1ar
