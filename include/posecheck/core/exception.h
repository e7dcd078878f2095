#pragma once

#include "posecheck/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception handling system for the posecheck library
 */

namespace posecheck {
namespace core {

/**
 * @brief Base exception class for all posecheck exceptions
 *
 * Carries a result code and optional context (usually file:line of the
 * throw site, filled in by POSECHECK_THROW).
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    /**
     * @brief Get the result code
     */
    ResultCode getResultCode() const noexcept { return result_code_; }

    /**
     * @brief Get the original error message without formatting
     */
    const std::string& getMessage() const noexcept { return message_; }

    /**
     * @brief Get the error context
     */
    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief File I/O and recording parse errors
 */
class FileException : public Exception {
public:
    FileException(ResultCode code,
                  const std::string& message,
                  const std::string& context = "")
        : Exception(code, message, context) {}
};

/**
 * @brief Configuration errors (missing or mistyped values)
 */
class ConfigurationException : public Exception {
public:
    ConfigurationException(const std::string& message,
                           const std::string& context = "")
        : Exception(ResultCode::ERROR_CONFIGURATION, message, context) {}
};

/**
 * @brief Convert result code to string representation
 * @param code Result code to convert
 * @return String representation of result code
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define POSECHECK_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define POSECHECK_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace posecheck
