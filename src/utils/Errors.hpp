#pragma once

#include <stdexcept>
#include <string>


namespace Errors {
/**
 * @brief Invalid startup configuration (rate, resolution, required paths).
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A frame source cannot produce frames (missing directory, no files, encode failure).
 */
class SourceUnavailable : public std::runtime_error {
public:
    explicit SourceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Send or receive failure on a single viewer connection.
 */
class TransportFailure : public std::runtime_error {
public:
    explicit TransportFailure(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A fetched frame could not be decoded for rendering.
 */
class DecodeFailure : public std::runtime_error {
public:
    explicit DecodeFailure(const std::string& what) : std::runtime_error(what) {}
};
}  // namespace Errors
