/**
 * @file errors.hpp
 * @brief Exception hierarchy reported by the World API
 *
 * Every World mutation validates its inputs before changing any state, so an
 * exception from this hierarchy leaves the World exactly as it was.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace Boxigon {

enum class ErrorCode {
    InvalidGeometry,
    InvalidParameters,
    UnknownBody,
    UnknownJoint,
    InvalidTimestep,
    SceneFormat
};

const char* toString(ErrorCode code);

/**
 * @class PhysicsError
 * @brief Base class of every recoverable error raised by the engine
 */
class PhysicsError : public std::runtime_error {
public:
    PhysicsError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return errorCode; }

private:
    ErrorCode errorCode;
};

/// Malformed or degenerate shape (too few vertices, non-convex, zero area, bad radius)
class InvalidGeometryError : public PhysicsError {
public:
    explicit InvalidGeometryError(const std::string& message)
        : PhysicsError(ErrorCode::InvalidGeometry, message) {}
};

/// Non-finite or out-of-range body, joint or query parameters
class InvalidParametersError : public PhysicsError {
public:
    explicit InvalidParametersError(const std::string& message)
        : PhysicsError(ErrorCode::InvalidParameters, message) {}
};

class UnknownBodyError : public PhysicsError {
public:
    explicit UnknownBodyError(std::uint32_t id);
};

class UnknownJointError : public PhysicsError {
public:
    explicit UnknownJointError(std::uint32_t id);
};

/// step() called with dt <= 0 or a non-finite dt
class InvalidTimestepError : public PhysicsError {
public:
    explicit InvalidTimestepError(double dt);
};

/// Scene text that cannot be parsed or describes an inconsistent scene
class SceneFormatError : public PhysicsError {
public:
    SceneFormatError(std::size_t line, const std::string& message);
};

} // namespace Boxigon
