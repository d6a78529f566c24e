#pragma once

#include <cstddef>

#include "f1ar/config.hpp"
#include "f1ar/dataset_assembler.hpp"
#include "f1ar/driver_track_extractor.hpp"
#include "f1ar/telemetry_source.hpp"

namespace f1ar {

struct RunSummary {
    std::size_t total_points = 0;
    std::size_t drivers_processed = 0;
    std::size_t drivers_skipped = 0;
};

// One-shot batch run over a single session. Drivers are extracted
// independently; a driver that throws is recorded in RaceDataset::skipped and
// the run continues.
// Throws SourceUnavailableError if the session cannot be loaded and
// NoUsableDataError if every driver was skipped.
class RacePipeline {
public:
    RacePipeline(ITelemetrySource& source, const PipelineConfig& config);
    RaceDataset run();

private:
    ITelemetrySource& source_;
    PipelineConfig config_;
    DriverTrackExtractor extractor_;
    DatasetAssembler assembler_;
};

RunSummary summarize(const RaceDataset& dataset);

// Logs the run summary and coordinate ranges at Info.
void log_summary(const RaceDataset& dataset);

} // namespace f1ar
