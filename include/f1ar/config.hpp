#pragma once
// Runtime configuration and command-line overrides.

#include <optional>
#include <string>

#include "f1ar/coordinate_mapper.hpp"
#include "f1ar/dataset_assembler.hpp"
#include "f1ar/logger.hpp"

namespace f1ar {

struct SessionConfig {
    int year = 2023;
    std::string grand_prix = "Bahrain";
    std::string session_type = "R";
};

struct SourceConfig {
    std::string cache_dir = "./cache";
};

struct ExportConfig {
    std::string output_dir = "../public";
    int indent = 2;
};

struct ConfigOverrides {
    std::optional<std::string> config_path;

    std::optional<int> year;
    std::optional<std::string> grand_prix;
    std::optional<std::string> session_type;
    std::optional<std::string> cache_dir;
    std::optional<std::string> output_dir;
    std::optional<ReferencePathRule> reference_path;
    std::optional<double> unit_scale;
    std::optional<LogLevel> log_level;

    // Unrecognised arguments are left for the caller.
    static ConfigOverrides from_args(int argc, char** argv);
};

struct PipelineConfig {
    SessionConfig session;
    SourceConfig source;
    CoordinateMapperConfig mapper;
    AssemblerConfig assembler;
    ExportConfig output;
    LogLevel log_level = LogLevel::Info;

    void apply_overrides(const ConfigOverrides& overrides);

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;
};

// Loads a pipeline_config.yaml from the given path.
// Applies hardcoded defaults first, then overrides with values from the file.
// Throws std::runtime_error if the file cannot be opened or parsed.
PipelineConfig load_config(const std::string& path);

} // namespace f1ar
