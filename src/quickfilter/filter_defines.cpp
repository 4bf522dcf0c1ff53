#include "quickfilter/filter_defines.hpp"
#include "quickfilter/filter_errors.hpp"

#include <plog/Log.h>

#include <unordered_map>

namespace quickfilter {

EdgeMode EdgeModeFromString(std::string_view mode_string) {
    using mode_map_t = std::unordered_map<std::string_view, EdgeMode>;
    static const mode_map_t mode_map = {
        {"constant", EdgeMode::CONSTANT},
        {"nearest", EdgeMode::NEAREST},
        {"reflect", EdgeMode::REFLECT},
        {"mirror", EdgeMode::MIRROR},
        {"wrap", EdgeMode::WRAP}
    };
    auto it = mode_map.find(mode_string);
    if (it == mode_map.end()) {
        PLOG_WARNING << "Unknown edge-handling mode: " << mode_string;
        throw InvalidModeError("Got invalid edge-handling mode: " + std::string(mode_string));
    }
    return it->second;
}

TruncateMode TruncateModeFromString(std::string_view mode_string) {
    using mode_map_t = std::unordered_map<std::string_view, TruncateMode>;
    static const mode_map_t mode_map = {
        {"valid", TruncateMode::VALID},
        {"same", TruncateMode::SAME},
        {"full", TruncateMode::FULL}
    };
    auto it = mode_map.find(mode_string);
    if (it == mode_map.end()) {
        PLOG_WARNING << "Unknown truncation mode: " << mode_string;
        throw InvalidModeError("Got invalid truncation mode: " + std::string(mode_string));
    }
    return it->second;
}

std::string ToString(EdgeMode mode) {
    switch (mode) {
    case EdgeMode::CONSTANT:
        return "constant";
    case EdgeMode::NEAREST:
        return "nearest";
    case EdgeMode::REFLECT:
        return "reflect";
    case EdgeMode::MIRROR:
        return "mirror";
    case EdgeMode::WRAP:
        return "wrap";
    default:
        return "unknown";
    }
}

std::string ToString(TruncateMode mode) {
    switch (mode) {
    case TruncateMode::VALID:
        return "valid";
    case TruncateMode::SAME:
        return "same";
    case TruncateMode::FULL:
        return "full";
    default:
        return "unknown";
    }
}

bool IsValid(EdgeMode mode) {
    switch (mode) {
    case EdgeMode::CONSTANT:
    case EdgeMode::NEAREST:
    case EdgeMode::REFLECT:
    case EdgeMode::MIRROR:
    case EdgeMode::WRAP:
        return true;
    default:
        return false;
    }
}

bool IsValid(TruncateMode mode) {
    switch (mode) {
    case TruncateMode::VALID:
    case TruncateMode::SAME:
    case TruncateMode::FULL:
        return true;
    default:
        return false;
    }
}

std::ostream& operator<<(std::ostream& out, EdgeMode mode) {
    out << ToString(mode);
    return out;
}

std::ostream& operator<<(std::ostream& out, TruncateMode mode) {
    out << ToString(mode);
    return out;
}

} // namespace quickfilter
