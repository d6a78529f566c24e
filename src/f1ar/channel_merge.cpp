#include "f1ar/channel_merge.hpp"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "f1ar/logger.hpp"

namespace f1ar {
namespace {

void check_lengths(const ChannelSeries& series, const std::string& label) {
    if (!series.session_time.has_value()) {
        return;
    }
    const std::size_t expected = series.session_time->size();
    for (const auto& kv : series.channels) {
        if (kv.second.size() != expected) {
            std::ostringstream oss;
            oss << label << " channel " << kv.first << " has " << kv.second.size()
                << " samples, expected " << expected;
            throw std::invalid_argument(oss.str());
        }
    }
}

std::vector<double> seconds_of(const std::vector<SessionDuration>& axis) {
    std::vector<double> out;
    out.reserve(axis.size());
    for (const auto& t : axis) {
        out.push_back(to_seconds(t));
    }
    return out;
}

std::vector<std::size_t> time_order(const std::vector<double>& seconds) {
    std::vector<std::size_t> order(seconds.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return seconds[a] < seconds[b];
    });
    return order;
}

// sorted_times must be non-decreasing and non-empty.
std::size_t nearest_index(const std::vector<double>& sorted_times, double t) {
    const auto it = std::lower_bound(sorted_times.begin(), sorted_times.end(), t);
    if (it == sorted_times.begin()) {
        return 0;
    }
    if (it == sorted_times.end()) {
        return sorted_times.size() - 1;
    }
    const std::size_t upper = static_cast<std::size_t>(it - sorted_times.begin());
    const std::size_t lower = upper - 1;
    return (t - sorted_times[lower] <= sorted_times[upper] - t) ? lower : upper;
}

} // namespace

ChannelSeries merge_channels(const ChannelSeries& position, const ChannelSeries& car) {
    check_lengths(position, "Position");
    check_lengths(car, "Car");

    if (!position.session_time.has_value()) {
        Logger::log(LogLevel::Debug, "Position series has no SessionTime axis; skipping merge.");
        return position;
    }

    const std::vector<double> pos_seconds = seconds_of(*position.session_time);
    const std::vector<std::size_t> pos_order = time_order(pos_seconds);

    ChannelSeries merged;
    merged.session_time = std::vector<SessionDuration>();
    merged.session_time->reserve(pos_order.size());
    for (const std::size_t i : pos_order) {
        merged.session_time->push_back((*position.session_time)[i]);
    }
    for (const auto& kv : position.channels) {
        std::vector<double> values;
        values.reserve(pos_order.size());
        for (const std::size_t i : pos_order) {
            values.push_back(kv.second[i]);
        }
        merged.channels.emplace(kv.first, std::move(values));
    }

    if (!car.session_time.has_value() || car.session_time->empty()) {
        Logger::log(LogLevel::Debug, "Car series has no usable SessionTime axis; no channels merged.");
        return merged;
    }

    const std::vector<double> car_seconds_raw = seconds_of(*car.session_time);
    const std::vector<std::size_t> car_order = time_order(car_seconds_raw);
    std::vector<double> car_seconds;
    car_seconds.reserve(car_order.size());
    for (const std::size_t i : car_order) {
        car_seconds.push_back(car_seconds_raw[i]);
    }

    std::vector<std::size_t> source_rows;
    source_rows.reserve(pos_order.size());
    for (const std::size_t i : pos_order) {
        source_rows.push_back(car_order[nearest_index(car_seconds, pos_seconds[i])]);
    }

    for (const auto& kv : car.channels) {
        if (merged.channels.find(kv.first) != merged.channels.end()) {
            continue;
        }
        std::vector<double> values;
        values.reserve(source_rows.size());
        for (const std::size_t row : source_rows) {
            values.push_back(kv.second[row]);
        }
        merged.channels.emplace(kv.first, std::move(values));
    }

    return merged;
}

} // namespace f1ar
