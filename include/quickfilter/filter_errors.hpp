#ifndef _QUICKFILTER_FILTER_ERRORS_H_
#define _QUICKFILTER_FILTER_ERRORS_H_

#include "base/defines.hpp"

#include <stdexcept>
#include <string>

namespace quickfilter {

// The signal is empty, shorter than the window, or the window is zero.
class QUICKFILTER_CPP_EXPORT LengthError : public std::length_error {
public:
    explicit LengthError(const std::string& what) : std::length_error(what) {}
};

// Unrecognized edge-handling or truncation mode.
class QUICKFILTER_CPP_EXPORT InvalidModeError : public std::invalid_argument {
public:
    explicit InvalidModeError(const std::string& what) : std::invalid_argument(what) {}
};

// Percentile (or the one derived from an index) outside [0, 1].
class QUICKFILTER_CPP_EXPORT SelectionRangeError : public std::out_of_range {
public:
    explicit SelectionRangeError(const std::string& what) : std::out_of_range(what) {}
};

// Caller supplied output does not have the required length.
class QUICKFILTER_CPP_EXPORT OutputLengthMismatchError : public std::length_error {
public:
    explicit OutputLengthMismatchError(const std::string& what) : std::length_error(what) {}
};

// NaN samples cannot be ordered.
class QUICKFILTER_CPP_EXPORT InvalidSampleError : public std::invalid_argument {
public:
    explicit InvalidSampleError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace quickfilter

#endif
