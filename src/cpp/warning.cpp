#include "celio/core/warning.hpp"

#include <cstdio>
#include <mutex>
#include <utility>

namespace celio {

namespace {

std::mutex& handler_mutex() {
    static std::mutex mutex;
    return mutex;
}

WarningHandler& current_handler() {
    static WarningHandler handler;
    return handler;
}

void default_sink(WarningCategory category, const std::string& message) {
    std::fprintf(stderr, "WARNING: [%s] %s\n",
                 warning_category_name(category), message.c_str());
}

} // namespace

const char* warning_category_name(WarningCategory category) noexcept {
    switch (category) {
        case WarningCategory::OldFormat:    return "OldFormatWarning";
        case WarningCategory::MalformedTag: return "MalformedTagWarning";
    }
    return "Warning";
}

WarningHandler set_warning_handler(WarningHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex());
    WarningHandler previous = std::move(current_handler());
    current_handler() = std::move(handler);
    return previous;
}

void warn(WarningCategory category, const std::string& message) {
    WarningHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex());
        handler = current_handler();
    }
    if (handler) {
        handler(category, message);
    } else {
        default_sink(category, message);
    }
}

} // namespace celio
