#include <report_transform/errors.hpp>

namespace report_transform {

const char* LayoutError::tag() const {
    switch (kind) {
        case ErrorKind::InvalidTrackDefinition: return "invalid_track_definition";
        case ErrorKind::UnknownElementType: return "unknown_element_type";
        case ErrorKind::InvalidProperty: return "invalid_property";
    }
    return "invalid_property";
}

std::string LayoutError::message() const {
    switch (kind) {
        case ErrorKind::InvalidTrackDefinition:
            return "Invalid " + subject + " definition: " + value;
        case ErrorKind::UnknownElementType:
            return "Unknown element type: " + subject;
        case ErrorKind::InvalidProperty:
            return "Invalid value for " + subject + ": " + value;
    }
    return subject;
}

LayoutError invalid_track_definition(std::string axis, std::string value) {
    return LayoutError{ ErrorKind::InvalidTrackDefinition, std::move(axis), std::move(value) };
}

LayoutError unknown_element_type(std::string description) {
    return LayoutError{ ErrorKind::UnknownElementType, std::move(description), {} };
}

LayoutError invalid_property(std::string property, std::string value) {
    return LayoutError{ ErrorKind::InvalidProperty, std::move(property), std::move(value) };
}

} // namespace report_transform
