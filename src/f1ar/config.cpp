#include "f1ar/config.hpp"

#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace f1ar {
namespace {

std::string value_after(const std::string& arg, const std::string& prefix) {
    return arg.substr(prefix.size());
}

bool has_prefix(const std::string& arg, const std::string& prefix) {
    return arg.rfind(prefix, 0) == 0;
}

} // namespace

PipelineConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Failed to open config file: " + path);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }

    PipelineConfig cfg{};
    try {
        cfg.session.year = root["session"]["year"].as<int>(cfg.session.year);
        cfg.session.grand_prix = root["session"]["grand_prix"].as<std::string>(cfg.session.grand_prix);
        cfg.session.session_type =
            root["session"]["session_type"].as<std::string>(cfg.session.session_type);

        cfg.source.cache_dir = root["source"]["cache_dir"].as<std::string>(cfg.source.cache_dir);

        cfg.mapper.unit_scale = root["pipeline"]["unit_scale"].as<double>(cfg.mapper.unit_scale);
        cfg.assembler.reference_path = parse_reference_path_rule(
            root["pipeline"]["reference_path"].as<std::string>(to_string(cfg.assembler.reference_path)));

        cfg.output.output_dir = root["output"]["dir"].as<std::string>(cfg.output.output_dir);
        cfg.output.indent = root["output"]["indent"].as<int>(cfg.output.indent);

        cfg.log_level = parse_log_level(root["log_level"].as<std::string>("info"));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value in config file " + path + ": " + e.what());
    }

    return cfg;
}

ConfigOverrides ConfigOverrides::from_args(int argc, char** argv) {
    ConfigOverrides overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            overrides.config_path = argv[++i];
        } else if (has_prefix(arg, "--config=")) {
            overrides.config_path = value_after(arg, "--config=");
        } else if (has_prefix(arg, "--year=")) {
            overrides.year = std::stoi(value_after(arg, "--year="));
        } else if (has_prefix(arg, "--gp=")) {
            overrides.grand_prix = value_after(arg, "--gp=");
        } else if (has_prefix(arg, "--session=")) {
            overrides.session_type = value_after(arg, "--session=");
        } else if (has_prefix(arg, "--cache-dir=")) {
            overrides.cache_dir = value_after(arg, "--cache-dir=");
        } else if (has_prefix(arg, "--output-dir=")) {
            overrides.output_dir = value_after(arg, "--output-dir=");
        } else if (has_prefix(arg, "--reference-path=")) {
            overrides.reference_path = parse_reference_path_rule(value_after(arg, "--reference-path="));
        } else if (has_prefix(arg, "--unit-scale=")) {
            overrides.unit_scale = std::stod(value_after(arg, "--unit-scale="));
        } else if (has_prefix(arg, "--log-level=")) {
            overrides.log_level = parse_log_level(value_after(arg, "--log-level="));
        }
    }

    return overrides;
}

void PipelineConfig::apply_overrides(const ConfigOverrides& overrides) {
    if (overrides.year.has_value()) {
        session.year = *overrides.year;
    }
    if (overrides.grand_prix.has_value()) {
        session.grand_prix = *overrides.grand_prix;
    }
    if (overrides.session_type.has_value()) {
        session.session_type = *overrides.session_type;
    }
    if (overrides.cache_dir.has_value()) {
        source.cache_dir = *overrides.cache_dir;
    }
    if (overrides.output_dir.has_value()) {
        output.output_dir = *overrides.output_dir;
    }
    if (overrides.reference_path.has_value()) {
        assembler.reference_path = *overrides.reference_path;
    }
    if (overrides.unit_scale.has_value()) {
        mapper.unit_scale = *overrides.unit_scale;
    }
    if (overrides.log_level.has_value()) {
        log_level = *overrides.log_level;
    }
}

void PipelineConfig::validate() const {
    if (session.grand_prix.empty()) {
        throw std::invalid_argument("session.grand_prix must not be empty.");
    }
    if (session.session_type.empty()) {
        throw std::invalid_argument("session.session_type must not be empty.");
    }
    if (source.cache_dir.empty()) {
        throw std::invalid_argument("source.cache_dir must not be empty.");
    }
    if (!(mapper.unit_scale > 0.0)) {
        throw std::invalid_argument("pipeline.unit_scale must be > 0.");
    }
    if (output.output_dir.empty()) {
        throw std::invalid_argument("output.dir must not be empty.");
    }
    if (output.indent < 0) {
        throw std::invalid_argument("output.indent must be >= 0.");
    }
}

} // namespace f1ar
