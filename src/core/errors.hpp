#pragma once

#include <stdexcept>
#include <string>

namespace calmpath {

class EngineError : public std::runtime_error {
public:
    enum class ErrorKind {
        NoGraphData,
        PointOutOfRange,
        NoRouteFound,
        Cancelled,
        InvalidRequest
    };

    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

const char* error_kind_name(EngineError::ErrorKind kind);

// No street data for the requested area.
class NoGraphDataError : public EngineError {
public:
    explicit NoGraphDataError(const std::string& message)
        : EngineError(ErrorKind::NoGraphData, message) {}
};

// Start or end lies outside the area the graph covers.
class PointOutOfRangeError : public EngineError {
public:
    explicit PointOutOfRangeError(const std::string& message)
        : EngineError(ErrorKind::PointOutOfRange, message) {}
};

// Start and end are in different connected components.
class NoRouteFoundError : public EngineError {
public:
    explicit NoRouteFoundError(const std::string& message)
        : EngineError(ErrorKind::NoRouteFound, message) {}
};

class CancelledError : public EngineError {
public:
    explicit CancelledError(const std::string& message)
        : EngineError(ErrorKind::Cancelled, message) {}
};

class InvalidRequestError : public EngineError {
public:
    explicit InvalidRequestError(const std::string& message)
        : EngineError(ErrorKind::InvalidRequest, message) {}
};

} // namespace calmpath
