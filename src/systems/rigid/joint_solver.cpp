/**
 * @file joint_solver.cpp
 * @brief Distance, pin and weld joint rows
 */

#include <cmath>
#include <vector>

#include "boxigon/systems/rigid/joint_solver.hpp"
#include "boxigon/core/debug.hpp"

namespace RigidBodyCollision
{

double Joint::impulseMagnitude() const {
    switch (spec.type) {
        case Boxigon::JointType::Distance:
            return std::fabs(axialImpulse);
        case Boxigon::JointType::Pin:
            return linearImpulse.length();
        case Boxigon::JointType::Weld:
            return std::sqrt(linearImpulse.lengthSquared() + angularImpulse * angularImpulse);
    }
    return 0.0;
}

/**
 * @brief Solves the 2x2 system K x = b; returns zero for a singular K
 */
static Vector solve22(double k11, double k12, double k22, const Vector& b)
{
    double det = k11 * k22 - k12 * k12;
    if (std::fabs(det) < EPSILON * EPSILON) {
        return {};
    }
    det = 1.0 / det;
    return {det * (k22 * b.x - k12 * b.y), det * (k11 * b.y - k12 * b.x)};
}

void JointSolver::prepare(const std::vector<Joint*>& joints,
                          SolverBodySet& bodies,
                          const SystemConfig& sysConfig,
                          const JointSolverConfig& config,
                          bool warmStarting)
{
    constraints.clear();
    constraints.reserve(joints.size());
    maxJointError = config.maxJointError;

    double const dt = sysConfig.timeStep;
    double const invDt = dt > 0.0 ? 1.0 / dt : 0.0;
    double const beta = config.jointBaumgarte;

    for (Joint* joint : joints) {
        JointConstraint jc;
        jc.joint = joint;
        jc.indexA = bodies.indexOf(joint->eA);
        jc.indexB = joint->eB == entt::null ? SolverBodySet::Ground : bodies.indexOf(joint->eB);

        const SolverBody& a = bodies[jc.indexA];
        const SolverBody& b = bodies[jc.indexB];

        Transform const xfA = a.transform();
        jc.rA = xfA.rotate(joint->spec.localAnchorA - a.localCenter);
        if (jc.indexB == SolverBodySet::Ground) {
            // World anchor: the ground body sits at the origin
            jc.rB = joint->spec.anchorB - b.center;
        } else {
            jc.rB = b.transform().rotate(joint->spec.anchorB - b.localCenter);
        }

        Vector const separation = (b.center + jc.rB) - (a.center + jc.rA);
        double const mA = a.invMass;
        double const mB = b.invMass;
        double const iA = a.invI;
        double const iB = b.invI;

        if (warmStarting) {
            jc.axialImpulse = joint->axialImpulse;
            jc.linearImpulse = joint->linearImpulse;
            jc.angularImpulse = joint->angularImpulse;
        }

        switch (joint->spec.type) {
            case Boxigon::JointType::Distance: {
                double const len = separation.length();
                jc.axis = len > EPSILON ? separation / len : Vector();
                double const crA = jc.rA.cross(jc.axis);
                double const crB = jc.rB.cross(jc.axis);
                double invMass = mA + iA * crA * crA + mB + iB * crB * crB;
                double const mass = invMass > 0.0 ? 1.0 / invMass : 0.0;
                double const C = len - joint->length;
                jc.error = std::fabs(C);

                if (joint->spec.frequencyHz > 0.0) {
                    // Soft constraint: spring stiffness k and damping d from frequency and ratio
                    double const omega = 2.0 * M_PI * joint->spec.frequencyHz;
                    double const d = 2.0 * mass * joint->spec.dampingRatio * omega;
                    double const k = mass * omega * omega;
                    double gamma = dt * (d + dt * k);
                    jc.gamma = gamma > 0.0 ? 1.0 / gamma : 0.0;
                    jc.bias = C * dt * k * jc.gamma;
                    invMass += jc.gamma;
                    // A spring never counts as stretched beyond repair
                    jc.error = 0.0;
                } else {
                    jc.gamma = 0.0;
                    jc.bias = beta * C * invDt;
                }
                jc.axialMass = invMass > 0.0 ? 1.0 / invMass : 0.0;
                break;
            }
            case Boxigon::JointType::Pin:
            case Boxigon::JointType::Weld: {
                jc.k11 = mA + mB + jc.rA.y * jc.rA.y * iA + jc.rB.y * jc.rB.y * iB;
                jc.k12 = -jc.rA.y * jc.rA.x * iA - jc.rB.y * jc.rB.x * iB;
                jc.k22 = mA + mB + jc.rA.x * jc.rA.x * iA + jc.rB.x * jc.rB.x * iB;
                jc.linearBias = separation * (beta * invDt);
                jc.error = separation.length();

                if (joint->spec.type == Boxigon::JointType::Weld) {
                    double const iSum = iA + iB;
                    jc.angularMass = iSum > 0.0 ? 1.0 / iSum : 0.0;
                    double const C = b.angle - a.angle - joint->referenceAngle;
                    jc.angularBias = beta * C * invDt;
                }
                break;
            }
        }

        constraints.push_back(jc);
    }
}

void JointSolver::warmStart(SolverBodySet& bodies) const
{
    for (const auto& jc : constraints) {
        SolverBody& a = bodies[jc.indexA];
        SolverBody& b = bodies[jc.indexB];
        switch (jc.joint->spec.type) {
            case Boxigon::JointType::Distance:
                applyImpulse(a, b, jc.rA, jc.rB, jc.axis * jc.axialImpulse);
                break;
            case Boxigon::JointType::Weld:
                a.w -= a.invI * jc.angularImpulse;
                b.w += b.invI * jc.angularImpulse;
                applyImpulse(a, b, jc.rA, jc.rB, jc.linearImpulse);
                break;
            case Boxigon::JointType::Pin:
                applyImpulse(a, b, jc.rA, jc.rB, jc.linearImpulse);
                break;
        }
    }
}

void JointSolver::solveVelocities(SolverBodySet& bodies)
{
    for (auto& jc : constraints) {
        SolverBody& a = bodies[jc.indexA];
        SolverBody& b = bodies[jc.indexB];

        if (jc.joint->spec.type == Boxigon::JointType::Distance) {
            Vector const vpA = a.v + crossSV(a.w, jc.rA);
            Vector const vpB = b.v + crossSV(b.w, jc.rB);
            double const cdot = jc.axis.dotProduct(vpB - vpA);
            double const impulse = -jc.axialMass * (cdot + jc.bias + jc.gamma * jc.axialImpulse);
            jc.axialImpulse += impulse;
            applyImpulse(a, b, jc.rA, jc.rB, jc.axis * impulse);
            continue;
        }

        if (jc.joint->spec.type == Boxigon::JointType::Weld) {
            double const cdot = b.w - a.w;
            double const impulse = -jc.angularMass * (cdot + jc.angularBias);
            jc.angularImpulse += impulse;
            a.w -= a.invI * impulse;
            b.w += b.invI * impulse;
        }

        Vector const cdot = b.v + crossSV(b.w, jc.rB) - a.v - crossSV(a.w, jc.rA);
        Vector const impulse = solve22(jc.k11, jc.k12, jc.k22, -(cdot + jc.linearBias));
        jc.linearImpulse += impulse;
        applyImpulse(a, b, jc.rA, jc.rB, impulse);
    }
}

void JointSolver::storeImpulses() const
{
    for (const auto& jc : constraints) {
        jc.joint->axialImpulse = jc.axialImpulse;
        jc.joint->linearImpulse = jc.linearImpulse;
        jc.joint->angularImpulse = jc.angularImpulse;
    }
}

std::vector<Boxigon::JointId> JointSolver::findBroken() const
{
    std::vector<Boxigon::JointId> broken;
    for (const auto& jc : constraints) {
        const Joint& joint = *jc.joint;
        double const magnitude = joint.impulseMagnitude();
        if (!std::isfinite(magnitude)) {
            BOXIGON_WARN("JointSolver", "joint " << joint.id << " produced a non-finite impulse");
            broken.push_back(joint.id);
        } else if (magnitude > joint.spec.breakImpulse) {
            BOXIGON_DEBUG_MSG(BOXIGON_DEBUG_LEVEL_BASIC,
                "[JointSolver] joint " << joint.id << " broke (impulse " << magnitude << ")\n");
            broken.push_back(joint.id);
        } else if (jc.error > maxJointError) {
            BOXIGON_WARN("JointSolver", "joint " << joint.id << " stretched " << jc.error
                         << " m, treated as impossible");
            broken.push_back(joint.id);
        }
    }
    return broken;
}

} // namespace RigidBodyCollision
