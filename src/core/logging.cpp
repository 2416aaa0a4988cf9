#include "logging.hpp"

#include <iostream>
#include <mutex>
#include <utility>

namespace calmpath {

namespace {

std::mutex& console_mutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

Logger::Logger(std::string component, LogCallback callback)
    : component_(std::move(component)), callback_(std::move(callback)) {}

void Logger::info(const std::string& message) const {
    log(message, false);
}

void Logger::error(const std::string& message) const {
    log(message, true);
}

void Logger::log(const std::string& message, bool is_error) const {
    if (callback_) {
        callback_(message, is_error);
        return;
    }

    std::lock_guard<std::mutex> lock(console_mutex());
    if (is_error) {
        std::cerr << "[" << component_ << " ERROR] " << message << std::endl;
    } else {
        std::cout << "[" << component_ << " INFO] " << message << std::endl;
    }
}

} // namespace calmpath
