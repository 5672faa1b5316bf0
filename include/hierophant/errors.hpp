/**
 * @file errors.hpp
 * @brief Exception types raised by map generation
 *
 * Validation failures derive from std::invalid_argument, geometry and
 * generation failures from std::runtime_error. Nothing is retried
 * automatically; callers catch the specific type they can handle.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace hierophant {

/// Invalid map configuration or config file contents
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message)
        : std::invalid_argument(message) {}
};

/// Polygon or partition that cannot be processed
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& message)
        : std::runtime_error(message) {}
};

/// A seed point has no partition cell at the output stage
class DegenerateCellError : public GeometryError {
public:
    DegenerateCellError(const std::string& message, size_t pointIndex)
        : GeometryError(message), pointIndex_(pointIndex) {}

    [[nodiscard]] size_t pointIndex() const { return pointIndex_; }

private:
    size_t pointIndex_;
};

/// Unique name generation gave up before collecting enough names
class NameExhaustionError : public std::runtime_error {
public:
    NameExhaustionError(const std::string& message, size_t requested, size_t found)
        : std::runtime_error(message), requested_(requested), found_(found) {}

    [[nodiscard]] size_t requested() const { return requested_; }
    [[nodiscard]] size_t found() const { return found_; }

private:
    size_t requested_;
    size_t found_;
};

}  // namespace hierophant
