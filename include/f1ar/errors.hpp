#pragma once
// Pipeline error types.

#include <stdexcept>
#include <string>

namespace f1ar {

// Upstream session could not be loaded. Fatal for the run.
class SourceUnavailableError : public std::runtime_error {
public:
    explicit SourceUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

// One driver could not be extracted. The pipeline drops the driver and continues.
class ExtractionError : public std::runtime_error {
public:
    explicit ExtractionError(const std::string& message) : std::runtime_error(message) {}
};

// Every driver was dropped.
class NoUsableDataError : public std::runtime_error {
public:
    explicit NoUsableDataError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace f1ar
