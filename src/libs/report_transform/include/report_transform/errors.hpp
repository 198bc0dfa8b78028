#pragma once

#include <string>
#include <utility>
#include <variant>

namespace report_transform {

enum class ErrorKind {
    InvalidTrackDefinition,
    UnknownElementType,
    InvalidProperty,
};

struct LayoutError {
    ErrorKind kind = ErrorKind::InvalidProperty;
    // Axis ("columns", "rows"), element type, or property name.
    std::string subject;
    // The offending value as authored.
    std::string value;

    // Stable machine-readable name, e.g. "invalid_track_definition".
    const char* tag() const;
    std::string message() const;

    bool operator==(const LayoutError&) const = default;
};

LayoutError invalid_track_definition(std::string axis, std::string value);
LayoutError unknown_element_type(std::string description);
LayoutError invalid_property(std::string property, std::string value);

// Value or the first error met while building it.
template <typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(LayoutError error) : state_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<T>(state_); }
    T& value() & { return std::get<T>(state_); }
    T&& value() && { return std::get<T>(std::move(state_)); }

    const LayoutError& error() const { return std::get<LayoutError>(state_); }

private:
    std::variant<T, LayoutError> state_;
};

} // namespace report_transform
