#pragma once

#include <functional>
#include <string>

namespace calmpath {

// Logging callback type for error reporting
using LogCallback = std::function<void(const std::string& message, bool is_error)>;

// Routes messages to the callback when one is set, otherwise to stdout/stderr
// prefixed with the component name. May be called from several threads.
class Logger {
public:
    explicit Logger(std::string component, LogCallback callback = nullptr);

    void info(const std::string& message) const;
    void error(const std::string& message) const;
    void log(const std::string& message, bool is_error) const;

private:
    std::string component_;
    LogCallback callback_;
};

} // namespace calmpath
