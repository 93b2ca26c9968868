#pragma once

#include "celio/core/macros.hpp"

#include <cstdint>
#include <functional>
#include <string>

// =============================================================================
// FILE: celio/core/warning.hpp
// BRIEF: Non-fatal diagnostics (legacy format, malformed metadata)
//
// Warnings never interrupt processing. The default sink prints to stderr;
// a process-wide handler may be installed to capture them instead.
// =============================================================================

namespace celio {

enum class WarningCategory : std::uint8_t {
    OldFormat,      // Node written without encoding metadata (deprecation-class)
    MalformedTag,   // Only one of the two encoding attributes is present
};

const char* warning_category_name(WarningCategory category) noexcept;

using WarningHandler = std::function<void(WarningCategory, const std::string&)>;

/// Install a handler; returns the previous one. An empty handler restores the
/// default stderr sink.
WarningHandler set_warning_handler(WarningHandler handler);

/// Emit a warning through the current handler.
void warn(WarningCategory category, const std::string& message);

/// RAII: install a handler for the current scope.
class ScopedWarningHandler {
public:
    explicit ScopedWarningHandler(WarningHandler handler)
        : previous_(set_warning_handler(std::move(handler))) {}

    ~ScopedWarningHandler() { set_warning_handler(std::move(previous_)); }

    ScopedWarningHandler(const ScopedWarningHandler&) = delete;
    ScopedWarningHandler& operator=(const ScopedWarningHandler&) = delete;

private:
    WarningHandler previous_;
};

} // namespace celio
