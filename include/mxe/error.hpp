/**
 * @file error.hpp
 * @brief MXE reader error handling.
 *
 * Provides both error-code-based and exception-based error handling.
 * The exception layer is compiled out with MXE_NO_EXCEPTIONS=1.
 */

#ifndef MXE_ERROR_HPP
#define MXE_ERROR_HPP

#include "config.hpp"

#include <cstddef>

#if !MXE_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#include <utility>
#endif

namespace mxe {

/**
 * @brief Error codes returned by every decoding stage.
 */
enum class Error {
    Ok = 0,                  ///< Success
    NotFound = -1,           ///< Input path missing or unreadable
    UnrecognizedFormat = -2, ///< Preamble is not a known block shape
    TruncatedStream = -3,    ///< Stream ended before a field was complete
    InvalidHeader = -4,      ///< Impossible raster geometry
    CorruptStream = -5,      ///< gzip layer reported damaged data
    InvalidArg = -6,         ///< Invalid argument
    WriteFailed = -7         ///< Output stream or file could not be written
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::NotFound:
        return "File not found or unreadable";
    case Error::UnrecognizedFormat:
        return "Not a recognized mxe format";
    case Error::TruncatedStream:
        return "Truncated stream";
    case Error::InvalidHeader:
        return "Invalid raster header";
    case Error::CorruptStream:
        return "Corrupt compressed stream";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::WriteFailed:
        return "Output could not be written";
    default:
        return "Unknown error";
    }
}

#if !MXE_NO_EXCEPTIONS

/**
 * @brief Base exception for MXE decoding errors.
 */
class MxeException : public std::runtime_error {
public:
    explicit MxeException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

class NotFoundException : public MxeException {
public:
    explicit NotFoundException(const std::string& message)
        : MxeException(message, Error::NotFound) {}
};

class FormatException : public MxeException {
public:
    explicit FormatException(const std::string& message)
        : MxeException(message, Error::UnrecognizedFormat) {}
};

/**
 * @brief Exception for a stream that ended inside a field.
 *
 * Carries the name of the field being read and the decompressed offset
 * at which the read started.
 */
class TruncatedStreamException : public MxeException {
public:
    TruncatedStreamException(const std::string& message, std::string field, std::size_t offset)
        : MxeException(message, Error::TruncatedStream), field_(std::move(field)),
          offset_(offset) {}

    const std::string& field() const noexcept {
        return field_;
    }

    std::size_t offset() const noexcept {
        return offset_;
    }

private:
    std::string field_;
    std::size_t offset_;
};

class InvalidHeaderException : public MxeException {
public:
    explicit InvalidHeaderException(const std::string& message)
        : MxeException(message, Error::InvalidHeader) {}
};

class CorruptStreamException : public MxeException {
public:
    explicit CorruptStreamException(const std::string& message)
        : MxeException(message, Error::CorruptStream) {}
};

#endif // !MXE_NO_EXCEPTIONS

} // namespace mxe

#endif // MXE_ERROR_HPP
