#ifndef _QUICKFILTER_FILTER_DEFINES_H_
#define _QUICKFILTER_FILTER_DEFINES_H_

#include "base/defines.hpp"

#include <string>
#include <string_view>
#include <iostream>

namespace quickfilter {

// How samples beyond the signal boundaries are synthesized.
enum class EdgeMode {
    CONSTANT,
    NEAREST,
    REFLECT, // d c b a | a b c d | d c b a
    MIRROR,  // d c b | a b c d | c b a
    WRAP     // a b c d | a b c d | a b c d
};

// How long the output is relative to the input.
enum class TruncateMode {
    VALID,
    SAME,
    FULL
};

// Throw InvalidModeError for unknown names.
QUICKFILTER_CPP_EXPORT EdgeMode EdgeModeFromString(std::string_view mode_string);
QUICKFILTER_CPP_EXPORT TruncateMode TruncateModeFromString(std::string_view mode_string);

QUICKFILTER_CPP_EXPORT std::string ToString(EdgeMode mode);
QUICKFILTER_CPP_EXPORT std::string ToString(TruncateMode mode);

QUICKFILTER_CPP_EXPORT bool IsValid(EdgeMode mode);
QUICKFILTER_CPP_EXPORT bool IsValid(TruncateMode mode);

// Overload operator <<
QUICKFILTER_CPP_EXPORT std::ostream& operator<<(std::ostream& out, EdgeMode mode);
QUICKFILTER_CPP_EXPORT std::ostream& operator<<(std::ostream& out, TruncateMode mode);

} // namespace quickfilter

#endif
