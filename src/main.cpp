#include <algorithm>
#include <array>
#include <cstddef>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "f1ar/cached_session_source.hpp"
#include "f1ar/config.hpp"
#include "f1ar/dataset_exporter.hpp"
#include "f1ar/dataset_inspector.hpp"
#include "f1ar/errors.hpp"
#include "f1ar/logger.hpp"
#include "f1ar/race_pipeline.hpp"

namespace f1ar {
namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

enum class Mode {
    Process,
    Check,
    Inspect,
    Help
};

struct Invocation {
    Mode mode = Mode::Process;
    std::string inspect_path;
};

Invocation parse_invocation(int argc, char** argv) {
    Invocation invocation;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--check" || arg == "test") {
            invocation.mode = Mode::Check;
        } else if (arg.rfind("--inspect=", 0) == 0) {
            invocation.mode = Mode::Inspect;
            invocation.inspect_path = arg.substr(std::string("--inspect=").size());
        } else if (arg == "--help" || arg == "-h") {
            invocation.mode = Mode::Help;
        }
    }
    return invocation;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config PATH] [--year=N] [--gp=NAME] [--session=TYPE]\n"
              << "       [--cache-dir=DIR] [--output-dir=DIR] [--reference-path=first|longest]\n"
              << "       [--unit-scale=X] [--log-level=debug|info|warn|error]\n"
              << "       [--check | --inspect=DATASET.json]\n";
}

int run_check(CachedSessionSource& source) {
    Logger::log(LogLevel::Info, "Session cache: " + source.session_dir().string());

    SessionInfo session;
    try {
        session = source.load_session();
    } catch (const SourceUnavailableError& e) {
        Logger::log(LogLevel::Error, e.what());
        Logger::log(LogLevel::Error, "Check that the session has been cached under the configured cache_dir.");
        return kExitFailure;
    }

    const auto& meta = session.metadata;
    Logger::log(LogLevel::Info, "Session loaded: " + meta.session_name);
    Logger::log(LogLevel::Info, "Event date: " + meta.event_date);
    if (meta.total_laps.has_value()) {
        Logger::log(LogLevel::Info, "Total laps: " + std::to_string(*meta.total_laps));
    }
    if (meta.track_length_km.has_value()) {
        std::ostringstream length;
        length << std::fixed << std::setprecision(3) << "Track length: " << *meta.track_length_km << " km";
        Logger::log(LogLevel::Info, length.str());
    }

    Logger::log(LogLevel::Info, "Drivers (" + std::to_string(session.drivers.size()) + " total):");
    const std::size_t shown = std::min<std::size_t>(session.drivers.size(), 5);
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& driver = session.drivers[i];
        Logger::log(LogLevel::Info, "  " + driver.id + ": " + driver.full_name);
    }
    if (session.drivers.size() > shown) {
        Logger::log(LogLevel::Info, "  ... and " + std::to_string(session.drivers.size() - shown) + " more");
    }
    Logger::log(LogLevel::Info, "Connection check successful.");
    return 0;
}

int run_inspect(const std::string& path) {
    const auto document = load_dataset_json(path);
    if (document.contains("metadata")) {
        Logger::log(LogLevel::Info, "Metadata: " + document["metadata"].dump());
    }

    const auto report = inspect_first_movement(document);
    if (!report.has_value()) {
        Logger::log(LogLevel::Warn, "Dataset has no telemetry.");
        return 0;
    }

    const auto format_point = [](const std::array<double, 3>& p) {
        std::ostringstream out;
        out << "[" << p[0] << ", " << p[1] << ", " << p[2] << "]";
        return out.str();
    };

    Logger::log(LogLevel::Info, "Driver: " + report->driver);
    Logger::log(LogLevel::Info, "Start position: " + format_point(report->start_position));
    if (report->first_movement.has_value()) {
        const auto& move = *report->first_movement;
        std::ostringstream line;
        line << "First movement at index " << move.index << ", time " << move.time << "s";
        Logger::log(LogLevel::Info, line.str());
        Logger::log(LogLevel::Info, "New position: " + format_point(move.position));
    } else {
        Logger::log(LogLevel::Warn, "Car never moves.");
    }
    return 0;
}

int run_process(ITelemetrySource& source, const PipelineConfig& config) {
    RacePipeline pipeline(source, config);
    const RaceDataset dataset = pipeline.run();

    DatasetExporter exporter(config.output);
    const auto path = exporter.write(dataset);

    log_summary(dataset);
    Logger::log(LogLevel::Info, "Race data exported to " + path.string());
    return 0;
}

} // namespace
} // namespace f1ar

int main(int argc, char** argv) {
    using namespace f1ar;

    const Invocation invocation = parse_invocation(argc, argv);
    if (invocation.mode == Mode::Help) {
        print_usage(argv[0]);
        return 0;
    }

    PipelineConfig config;
    try {
        const ConfigOverrides overrides = ConfigOverrides::from_args(argc, argv);
        if (overrides.config_path.has_value()) {
            config = load_config(*overrides.config_path);
        }
        config.apply_overrides(overrides);
        config.validate();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Configuration error: ") + e.what());
        print_usage(argv[0]);
        return kExitUsage;
    }
    Logger::set_min_level(config.log_level);

    try {
        if (invocation.mode == Mode::Inspect) {
            return run_inspect(invocation.inspect_path);
        }

        CachedSessionSource source(config);
        if (invocation.mode == Mode::Check) {
            return run_check(source);
        }
        return run_process(source, config);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Error processing race data: ") + e.what());
        return kExitFailure;
    }
}
