#include "boxigon/core/types.hpp"
#include "boxigon/core/defs.hpp"
#include "boxigon/core/events.hpp"

namespace Boxigon {

const char* toString(BodyKind kind) {
    switch (kind) {
        case BodyKind::Static:    return "static";
        case BodyKind::Kinematic: return "kinematic";
        case BodyKind::Dynamic:   return "dynamic";
    }
    return "unknown";
}

const char* toString(JointType type) {
    switch (type) {
        case JointType::Distance: return "distance";
        case JointType::Pin:      return "pin";
        case JointType::Weld:     return "weld";
    }
    return "unknown";
}

const char* toString(EventType type) {
    switch (type) {
        case EventType::BodyWoke:       return "BodyWoke";
        case EventType::CollisionBegan: return "CollisionBegan";
        case EventType::CollisionEnded: return "CollisionEnded";
        case EventType::JointBroken:    return "JointBroken";
        case EventType::BodySlept:      return "BodySlept";
    }
    return "Unknown";
}

} // namespace Boxigon
