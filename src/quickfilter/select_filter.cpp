#include "quickfilter/select_filter.hpp"
#include "quickfilter/edge_extender.hpp"
#include "quickfilter/filter_errors.hpp"
#include "quickfilter/order_statistic_tree.hpp"
#include "quickfilter/output_buffer.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cassert>
#include <cmath>
#include <string>

namespace quickfilter {
namespace {

void CheckSignalLength(size_t signal_length, size_t window_size) {
    if (window_size == 0) {
        PLOG_WARNING << "Window size must be positive.";
        throw LengthError("Window size must be positive");
    }
    if (signal_length < window_size) {
        PLOG_WARNING << "Signal length " << signal_length << " is smaller than window size " << window_size;
        throw LengthError("Input length cannot be smaller than the window size");
    }
}

void CheckPercent(double percent) {
    if (!(percent >= 0.0 && percent <= 1.0)) {
        PLOG_WARNING << "Selection percent " << percent << " is out of range.";
        throw SelectionRangeError("Selection index cannot be negative or greater than the window size");
    }
}

} // namespace

SelectFilter::SelectFilter(Configuration config)
    : config_(std::move(config)) {}

SelectFilter::~SelectFilter() = default;

double SelectFilter::effective_percent() const {
    if (config_.index && config_.window_size > 0) {
        return static_cast<double>(*config_.index) / static_cast<double>(config_.window_size);
    }
    return config_.percent;
}

size_t SelectFilter::OutputLength(size_t signal_length) const {
    CheckSignalLength(signal_length, config_.window_size);
    switch (config_.truncate_mode) {
    case TruncateMode::VALID:
        // One less than the count of windows fully inside the signal,
        // kept for compatibility with existing results.
        return signal_length - config_.window_size;
    case TruncateMode::SAME:
        return signal_length;
    case TruncateMode::FULL:
        return signal_length + config_.window_size - 1;
    default:
        throw InvalidModeError("Got invalid truncation mode: " + ToString(config_.truncate_mode));
    }
}

std::vector<double> SelectFilter::Apply(ArrayView<const double> signal) const {
    Validate(signal);
    OutputBuffer output = OutputBuffer::Prepare(std::nullopt, OutputLength(signal.size()));
    Run(signal, output);
    return output.Release();
}

void SelectFilter::Apply(ArrayView<const double> signal, ArrayView<double> output) const {
    Validate(signal);
    OutputBuffer buffer = OutputBuffer::Prepare(output, OutputLength(signal.size()));
    Run(signal, buffer);
}

void SelectFilter::Validate(ArrayView<const double> signal) const {
    if (signal.empty()) {
        PLOG_WARNING << "Signal is empty.";
        throw LengthError("Input signal is empty");
    }
    CheckSignalLength(signal.size(), config_.window_size);

    if (!IsValid(config_.edge_mode)) {
        PLOG_WARNING << "Invalid edge-handling mode: " << static_cast<int>(config_.edge_mode);
        throw InvalidModeError("Got invalid edge-handling mode: " + std::to_string(static_cast<int>(config_.edge_mode)));
    }

    CheckPercent(effective_percent());

    if (!IsValid(config_.truncate_mode)) {
        PLOG_WARNING << "Invalid truncation mode: " << static_cast<int>(config_.truncate_mode);
        throw InvalidModeError("Got invalid truncation mode: " + std::to_string(static_cast<int>(config_.truncate_mode)));
    }

    for (size_t i = 0; i < signal.size(); ++i) {
        if (std::isnan(signal[i])) {
            PLOG_WARNING << "NaN sample at " << i;
            throw InvalidSampleError("Signal contains NaN at index " + std::to_string(i));
        }
    }
    if (config_.edge_mode == EdgeMode::CONSTANT &&
        config_.truncate_mode != TruncateMode::VALID &&
        std::isnan(config_.constant_value)) {
        PLOG_WARNING << "Constant padding value is NaN.";
        throw InvalidSampleError("Constant padding value cannot be NaN");
    }
}

void SelectFilter::Run(ArrayView<const double> signal, OutputBuffer& output) const {
    const size_t window_size = config_.window_size;
    PLOG_VERBOSE << "Select filtering " << signal.size() << " samples, window_size=" << window_size
                 << ", percent=" << effective_percent()
                 << ", edge_mode=" << config_.edge_mode
                 << ", truncate_mode=" << config_.truncate_mode
                 << ", output_length=" << output.size();

    switch (config_.truncate_mode) {
    case TruncateMode::VALID:
        SlidingPass(signal, output);
        break;
    case TruncateMode::SAME: {
        const auto extended = ExtendEdges(signal, window_size, config_.edge_mode, config_.constant_value);
        SlidingPass(extended, output);
        break;
    }
    case TruncateMode::FULL: {
        // Every placement overlapping the signal by at least one sample,
        // plus one trailing sample consumed by the last admission.
        const auto extended = ExtendEdges(signal, window_size - 1, window_size, config_.edge_mode, config_.constant_value);
        SlidingPass(extended, output);
        break;
    }
    default:
        QUICKFILTER_NOTREACHED();
        break;
    }
}

void SelectFilter::SlidingPass(ArrayView<const double> working, OutputBuffer& output) const {
    const size_t window_size = config_.window_size;
    assert(working.size() >= window_size);
    assert(output.size() == working.size() - window_size);

    // A configured index selects its rank directly, which is what
    // `floor(window_size * index / window_size)` means without the
    // floating point rounding.
    std::optional<size_t> rank;
    if (config_.index) {
        rank = std::min(static_cast<size_t>(*config_.index), window_size - 1);
    }
    const double percent = effective_percent();

    OrderStatisticTree<double> tree;
    for (size_t i = 0; i < working.size(); ++i) {
        if (i >= window_size) {
            output[i - window_size] = rank ? tree.SelectRank(*rank) : tree.Select(percent);
            // The value sliding out of the window.
            if (!tree.Erase(working[i - window_size])) {
                PLOG_ERROR << "Failed to erase " << working[i - window_size] << " at " << i - window_size;
                throw std::logic_error("Sliding window lost track of sample " + std::to_string(i - window_size));
            }
        }
        tree.Insert(working[i]);
    }
}

std::vector<double> QuickFilter(ArrayView<const double> signal,
                                size_t window_size,
                                std::optional<int64_t> index,
                                double percent,
                                std::optional<ArrayView<double>> output,
                                std::string_view edge_mode,
                                std::string_view truncate_mode,
                                double constant_value) {
    // Length problems are reported ahead of unknown mode names.
    CheckSignalLength(signal.size(), window_size);

    SelectFilter::Configuration config(window_size);
    config.index = index;
    config.percent = percent;
    config.edge_mode = EdgeModeFromString(edge_mode);
    config.constant_value = constant_value;
    // Percentile range is checked before the truncation mode name.
    CheckPercent(SelectFilter(config).effective_percent());
    config.truncate_mode = TruncateModeFromString(truncate_mode);

    const SelectFilter filter(config);
    if (output) {
        filter.Apply(signal, *output);
        return std::vector<double>(output->begin(), output->end());
    }
    return filter.Apply(signal);
}

} // namespace quickfilter
