#include "reference_filter.hpp"

// quickfilter
#include <common/logger.hpp>
#include <common/utils_random.hpp>
#include <quickfilter/filter_defines.hpp>
#include <quickfilter/select_filter.hpp>

#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

struct BenchOptions {
    size_t signal_length = 1 << 12;
    size_t window_size = 1 << 12;
    double percent = 0.5;
    std::string edge_mode = "wrap";
    double constant_value = 0.0;
};

// filter_bench [signal_length] [window_size] [percent] [edge_mode]
BenchOptions ParseOptions(int argc, const char* argv[]) {
    BenchOptions options;
    if (argc > 1) {
        options.signal_length = std::stoul(argv[1]);
    }
    if (argc > 2) {
        options.window_size = std::stoul(argv[2]);
    }
    if (argc > 3) {
        options.percent = std::stod(argv[3]);
    }
    if (argc > 4) {
        options.edge_mode = argv[4];
    }
    return options;
}

template <typename F>
double MeasureSeconds(F&& f) {
    const auto start = std::chrono::steady_clock::now();
    f();
    const auto end = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(end - start).count();
}

} // namespace

int main(int argc, const char* argv[]) {

    quickfilter::logging::InitLogger(quickfilter::logging::Level::INFO);

    BenchOptions options;
    try {
        options = ParseOptions(argc, argv);
    } catch (const std::exception& e) {
        PLOG_ERROR << "Invalid arguments: " << e.what();
        std::cerr << "Usage: " << argv[0] << " [signal_length] [window_size] [percent] [edge_mode]" << std::endl;
        return 1;
    }

    const auto signal = quickfilter::utils::random::random_normal_sequence(options.signal_length);

    try {
        const auto edge_mode = quickfilter::EdgeModeFromString(options.edge_mode);

        // Validates the parameters for both runs.
        std::vector<double> filtered;
        const double filter_time = MeasureSeconds([&]() {
            filtered = quickfilter::QuickFilter(signal, options.window_size, std::nullopt, options.percent,
                                                std::nullopt, options.edge_mode, "same", options.constant_value);
        });

        std::vector<double> reference;
        const double reference_time = MeasureSeconds([&]() {
            reference = bench::ReferenceFilter(signal, options.window_size, options.percent, edge_mode, options.constant_value);
        });

        double total_difference = 0.0;
        for (size_t i = 0; i < filtered.size(); ++i) {
            total_difference += std::abs(filtered[i] - reference[i]);
        }

        PLOG_INFO << "signal_length=" << options.signal_length
                  << ", window_size=" << options.window_size
                  << ", percent=" << options.percent
                  << ", edge_mode=" << edge_mode;
        PLOG_INFO << "reference: " << reference_time << " s, quickfilter: " << filter_time << " s, speedup: "
                  << (filter_time > 0 ? reference_time / filter_time : 0.0);
        PLOG_INFO << "summed absolute difference: " << total_difference;
        return total_difference == 0.0 ? 0 : 2;
    } catch (const std::exception& e) {
        PLOG_ERROR << "Filtering failed: " << e.what();
        return 1;
    }
}
