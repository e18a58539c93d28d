#pragma once

#include <stdexcept>
#include <string>

namespace babbler {

/**
 * Error reporting for the babbler tool chain.
 *
 * The generative core signals degenerate inputs by value (empty results,
 * clamped exponents). Exceptions are reserved for malformed snapshots,
 * invalid configuration and I/O failures.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Snapshot / data format errors
    PARSE_ERROR = 100,

    // I/O errors
    FILE_NOT_FOUND = 300,

    INTERNAL_ERROR = 500
};

class BabblerException : public std::runtime_error {
public:
    explicit BabblerException(ErrorCode code, const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Babbler error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public BabblerException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : BabblerException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Snapshot text or record that cannot be turned into a valid chain
class SnapshotError : public BabblerException {
public:
    explicit SnapshotError(const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : BabblerException(ErrorCode::PARSE_ERROR, message, context, suggestion) {}
};

class IOError : public BabblerException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : BabblerException(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw BabblerException(code, message, context, suggestion);
        }
    }
};

#define BABBLER_CHECK(condition, code, message) \
    babbler::ErrorHandler::check_condition(condition, code, message, __func__)

#define BABBLER_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw babbler::InvalidArgumentError(message, __func__); } while (0)

} // namespace babbler
