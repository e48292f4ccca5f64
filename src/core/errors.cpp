#include "boxigon/core/errors.hpp"

#include <sstream>

namespace Boxigon {

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidGeometry:   return "InvalidGeometry";
        case ErrorCode::InvalidParameters: return "InvalidParameters";
        case ErrorCode::UnknownBody:       return "UnknownBody";
        case ErrorCode::UnknownJoint:      return "UnknownJoint";
        case ErrorCode::InvalidTimestep:   return "InvalidTimestep";
        case ErrorCode::SceneFormat:       return "SceneFormat";
    }
    return "Unknown";
}

PhysicsError::PhysicsError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(toString(code)) + ": " + message)
    , errorCode(code)
{
}

UnknownBodyError::UnknownBodyError(std::uint32_t id)
    : PhysicsError(ErrorCode::UnknownBody, "no body with id " + std::to_string(id))
{
}

UnknownJointError::UnknownJointError(std::uint32_t id)
    : PhysicsError(ErrorCode::UnknownJoint, "no joint with id " + std::to_string(id))
{
}

static std::string describeTimestep(double dt) {
    std::ostringstream oss;
    oss << "timestep must be finite and positive, got " << dt;
    return oss.str();
}

InvalidTimestepError::InvalidTimestepError(double dt)
    : PhysicsError(ErrorCode::InvalidTimestep, describeTimestep(dt))
{
}

SceneFormatError::SceneFormatError(std::size_t line, const std::string& message)
    : PhysicsError(ErrorCode::SceneFormat, "line " + std::to_string(line) + ": " + message)
{
}

} // namespace Boxigon
