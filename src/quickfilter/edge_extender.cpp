#include "quickfilter/edge_extender.hpp"
#include "quickfilter/filter_errors.hpp"

#include <plog/Log.h>

namespace quickfilter {
namespace {

// Non-negative remainder.
int64_t FloorMod(int64_t value, int64_t modulus) {
    const int64_t remainder = value % modulus;
    return remainder < 0 ? remainder + modulus : remainder;
}

// Maps a position outside [0, length) back onto the signal.
size_t FoldIndex(int64_t index, int64_t length, EdgeMode mode) {
    switch (mode) {
    case EdgeMode::NEAREST:
        return index < 0 ? 0 : static_cast<size_t>(length - 1);
    case EdgeMode::REFLECT: {
        // Period of 2n, edge sample repeated.
        const int64_t folded = FloorMod(index, 2 * length);
        return static_cast<size_t>(folded < length ? folded : 2 * length - 1 - folded);
    }
    case EdgeMode::MIRROR: {
        // Period of 2(n-1), edge sample not repeated.
        if (length == 1) {
            return 0;
        }
        const int64_t folded = FloorMod(index, 2 * length - 2);
        return static_cast<size_t>(folded < length ? folded : 2 * length - 2 - folded);
    }
    case EdgeMode::WRAP:
        return static_cast<size_t>(FloorMod(index, length));
    default:
        throw InvalidModeError("Got invalid edge-handling mode: " + ToString(mode));
    }
}

} // namespace

std::vector<double> ExtendEdges(ArrayView<const double> signal,
                                size_t front,
                                size_t back,
                                EdgeMode mode,
                                double constant_value) {
    if (signal.empty()) {
        throw LengthError("Cannot extend the edges of an empty signal");
    }
    if (!IsValid(mode)) {
        PLOG_WARNING << "Invalid edge-handling mode: " << static_cast<int>(mode);
        throw InvalidModeError("Got invalid edge-handling mode: " + std::to_string(static_cast<int>(mode)));
    }

    const int64_t length = static_cast<int64_t>(signal.size());
    std::vector<double> extended;
    extended.reserve(signal.size() + front + back);

    auto sample_at = [&](int64_t index) {
        if (index >= 0 && index < length) {
            return signal[static_cast<size_t>(index)];
        }
        if (mode == EdgeMode::CONSTANT) {
            return constant_value;
        }
        return signal[FoldIndex(index, length, mode)];
    };

    const int64_t first = -static_cast<int64_t>(front);
    const int64_t last = length + static_cast<int64_t>(back);
    for (int64_t index = first; index < last; ++index) {
        extended.push_back(sample_at(index));
    }
    return extended;
}

std::vector<double> ExtendEdges(ArrayView<const double> signal,
                                size_t window_size,
                                EdgeMode mode,
                                double constant_value) {
    const size_t half_window_size = window_size / 2;
    return ExtendEdges(signal, half_window_size, window_size - half_window_size, mode, constant_value);
}

} // namespace quickfilter
