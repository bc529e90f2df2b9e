/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Exception hierarchy carrying the throw site

**************************************************/

#ifndef VIGIL_ERROR_EXCEPTION_HPP
#define VIGIL_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "vigil/macro.hpp"

namespace vigil::error {

/**
 * @brief Base exception of the library.
 *
 * Records where it was thrown. Only programming errors are reported through
 * exceptions; problems with the data being validated or sanitized are
 * returned as diagnostics instead.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Constructs an exception from the throw site and message parts.
     * @param file Source file of the throw site
     * @param line Source line of the throw site
     * @param func Function of the throw site
     * @param args Message fragments, streamed one after another
     */
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
    }

    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    std::thread::id thread_id_;
    mutable std::string full_message_;
};

/// Registration into a sealed registry, or an unusable registration.
class RegistryError : public Exception {
public:
    using Exception::Exception;
};

/// Accessing a Value as a kind it does not hold.
class ValueTypeError : public Exception {
public:
    using Exception::Exception;
};

/// Inconsistent schema builder arguments.
class SchemaError : public Exception {
public:
    using Exception::Exception;
};

/// A transform function failed while reshaping valid data.
class TransformError : public Exception {
public:
    using Exception::Exception;
};

}  // namespace vigil::error

#define THROW_REGISTRY_ERROR(...)                                          \
    throw vigil::error::RegistryError(VIGIL_FILE_NAME, VIGIL_FILE_LINE,    \
                                      VIGIL_FUNC_NAME, __VA_ARGS__)

#define THROW_VALUE_TYPE_ERROR(...)                                        \
    throw vigil::error::ValueTypeError(VIGIL_FILE_NAME, VIGIL_FILE_LINE,   \
                                       VIGIL_FUNC_NAME, __VA_ARGS__)

#define THROW_SCHEMA_ERROR(...)                                            \
    throw vigil::error::SchemaError(VIGIL_FILE_NAME, VIGIL_FILE_LINE,      \
                                    VIGIL_FUNC_NAME, __VA_ARGS__)

#define THROW_TRANSFORM_ERROR(...)                                         \
    throw vigil::error::TransformError(VIGIL_FILE_NAME, VIGIL_FILE_LINE,   \
                                       VIGIL_FUNC_NAME, __VA_ARGS__)

#endif  // VIGIL_ERROR_EXCEPTION_HPP
