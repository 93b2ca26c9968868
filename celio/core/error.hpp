#pragma once

#include "celio/core/macros.hpp"
#include <exception>
#include <string>
#include <utility>
#include <vector>
#include <cstdint>

// =============================================================================
// FILE: celio/core/error.hpp
// BRIEF: celio Core Exception System
// =============================================================================

namespace celio {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : std::int32_t {
    OK = 0,

    // General errors
    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,

    // Argument errors
    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    INDEX_OUT_OF_BOUNDS = 14,
    RESERVED_NAME = 15,

    // Type errors
    TYPE_ERROR = 20,
    TYPE_MISMATCH = 21,

    // I/O errors
    IO_ERROR = 30,
    FILE_NOT_FOUND = 31,
    READ_ERROR = 33,
    WRITE_ERROR = 34,

    // Dispatch errors
    NO_WRITER_FOUND = 60,
    NO_READER_FOUND = 61,
    NO_PARTIAL_READER_FOUND = 62,

    // Feature errors
    FEATURE_UNAVAILABLE = 41,
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// Every celio exception carries the traversal path (sequence of keys from
/// the root of the write/read call) at which it was raised. Dispatch entry
/// points extend the path while the exception unwinds; the dynamic type and
/// code never change.
class CELIO_EXPORT Exception : public std::exception {
public:
    explicit Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)), what_(msg_) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return what_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return msg_;
    }

    /// Path from the outermost key to the failing node, joined with '/'.
    [[nodiscard]] auto path() const -> std::string {
        std::string out;
        for (auto it = keys_.rbegin(); it != keys_.rend(); ++it) {
            if (!out.empty()) out += '/';
            out += *it;
        }
        return out;
    }

    /// Prepend an enclosing key. Called while unwinding, innermost first.
    void push_key(const std::string& key) {
        if (key.empty() || key == "/") return;
        keys_.push_back(key);
        what_ = msg_ + " [at '" + path() + "']";
    }

protected:
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    ErrorCode code_;
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    std::string msg_;

private:
    std::vector<std::string> keys_;
    std::string what_;
};

// =============================================================================
// Specialized Exception Classes
// =============================================================================

class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& msg)
        : Exception(ErrorCode::UNKNOWN, msg) {}

    explicit RuntimeError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class InternalError : public RuntimeError {
public:
    explicit InternalError(const std::string& msg)
        : RuntimeError(ErrorCode::INTERNAL_ERROR, "Internal celio Error: " + msg) {}
};

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class DimensionError : public ValueError {
public:
    explicit DimensionError(const std::string& msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
};

class IndexOutOfBoundsError : public ValueError {
public:
    explicit IndexOutOfBoundsError(const std::string& msg)
        : ValueError(ErrorCode::INDEX_OUT_OF_BOUNDS, msg) {}
};

class ReservedColumnNameError : public ValueError {
public:
    explicit ReservedColumnNameError(const std::string& name)
        : ValueError(ErrorCode::RESERVED_NAME,
                     "'" + name + "' is a reserved name for dataframe columns."),
          name_(name) {}

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

private:
    std::string name_;
};

class TypeError : public Exception {
public:
    explicit TypeError(const std::string& msg)
        : Exception(ErrorCode::TYPE_ERROR, msg) {}

protected:
    explicit TypeError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class TypeMismatchError : public TypeError {
public:
    explicit TypeMismatchError(const std::string& msg)
        : TypeError(ErrorCode::TYPE_MISMATCH, msg) {}
};

class IOError : public Exception {
public:
    explicit IOError(const std::string& msg)
        : Exception(ErrorCode::IO_ERROR, msg) {}

protected:
    explicit IOError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class FileNotFoundError : public IOError {
public:
    explicit FileNotFoundError(const std::string& path)
        : IOError(ErrorCode::FILE_NOT_FOUND, "File not found: " + path) {}
};

class ReadError : public IOError {
public:
    explicit ReadError(const std::string& msg)
        : IOError(ErrorCode::READ_ERROR, msg) {}
};

class WriteError : public IOError {
public:
    explicit WriteError(const std::string& msg)
        : IOError(ErrorCode::WRITE_ERROR, msg) {}
};

class FeatureUnavailableError : public Exception {
public:
    explicit FeatureUnavailableError(const std::string& msg)
        : Exception(ErrorCode::FEATURE_UNAVAILABLE, msg) {}
};

// =============================================================================
// Dispatch Errors
// =============================================================================

class DispatchError : public Exception {
protected:
    DispatchError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class NoWriterFoundError : public DispatchError {
public:
    NoWriterFoundError(std::string value_type, std::string backend)
        : DispatchError(ErrorCode::NO_WRITER_FOUND,
                        "No method has been defined for writing " + value_type +
                        " elements to " + backend),
          value_type_(std::move(value_type)), backend_(std::move(backend)) {}

    [[nodiscard]] auto value_type() const noexcept -> const std::string& { return value_type_; }
    [[nodiscard]] auto backend() const noexcept -> const std::string& { return backend_; }

private:
    std::string value_type_;
    std::string backend_;
};

class NoReaderFoundError : public DispatchError {
public:
    NoReaderFoundError(std::string tag, std::string backend)
        : DispatchError(ErrorCode::NO_READER_FOUND,
                        "No read method registered for " + tag + " from " + backend),
          tag_(std::move(tag)), backend_(std::move(backend)) {}

    [[nodiscard]] auto tag() const noexcept -> const std::string& { return tag_; }
    [[nodiscard]] auto backend() const noexcept -> const std::string& { return backend_; }

private:
    std::string tag_;
    std::string backend_;
};

class NoPartialReaderFoundError : public DispatchError {
public:
    NoPartialReaderFoundError(std::string tag, std::string backend)
        : DispatchError(ErrorCode::NO_PARTIAL_READER_FOUND,
                        "No partial read method registered for " + tag + " from " + backend),
          tag_(std::move(tag)), backend_(std::move(backend)) {}

    [[nodiscard]] auto tag() const noexcept -> const std::string& { return tag_; }
    [[nodiscard]] auto backend() const noexcept -> const std::string& { return backend_; }

private:
    std::string tag_;
    std::string backend_;
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// Validation for user inputs
#define CELIO_CHECK_ARG(condition, msg) \
    do { \
        if (CELIO_UNLIKELY(!(condition))) { \
            throw celio::ValueError(msg); \
        } \
    } while(0)

// Validation for dimension mismatches
#define CELIO_CHECK_DIM(condition, msg) \
    do { \
        if (CELIO_UNLIKELY(!(condition))) { \
            throw celio::DimensionError(msg); \
        } \
    } while(0)

// Validation for index bounds
#define CELIO_CHECK_BOUNDS(index, size, msg) \
    do { \
        if (CELIO_UNLIKELY((index) < 0 || static_cast<std::size_t>(index) >= (size))) { \
            throw celio::IndexOutOfBoundsError(msg); \
        } \
    } while(0)
// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace celio
