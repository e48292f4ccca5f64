/**
 * @file profile.hpp
 * @brief Hierarchical scope timer for the step pipeline
 *
 * Each named scope accumulates total time, self time (excluding nested scopes),
 * call count and min/max durations. Scopes opened while another is active are
 * recorded as its children, so printStats() renders the step as a tree:
 *
 * @code
 * void World::step(double dt) {
 *     BOXIGON_PROFILE_SCOPE("World::step");
 *     {
 *         BOXIGON_PROFILE_SCOPE("Broadphase");
 *         // ...
 *     }
 * }
 *
 * Profiling::Profiler::printStats(std::cout);
 * @endcode
 *
 * The profiler is process-global and single-threaded; scopes must only be
 * opened on the simulation thread.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide registry of timed scopes (singleton)
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing of one named scope
     */
    struct ScopeStats {
        Duration total{0};                 ///< Sum of all durations
        Duration self{0};                  ///< Total minus time spent in child scopes
        std::uint64_t calls{0};            ///< Number of completed entries
        Duration shortest{Duration::max()};
        Duration longest{0};
        std::string parent;                ///< Empty for root scopes
        std::vector<std::string> children; ///< In first-seen order
    };

    /** @brief Opens a scope; nested under the currently open scope if any */
    static void begin(const std::string& name);

    /** @brief Closes the innermost scope, which must be @p name */
    static void end(const std::string& name);

    /** @brief Writes the scope tree with percentages of the root total */
    static void printStats(std::ostream& os);

    /** @brief Returns the collected statistics of @p name, or nullptr */
    static const ScopeStats* find(const std::string& name);

    /** @brief Discards all statistics */
    static void reset();

    /** @brief Runtime switch; scopes opened while disabled are not recorded */
    static void setEnabled(bool enabled);
    static bool isEnabled();

private:
    struct OpenScope {
        std::string name;
        TimePoint started;
    };

    std::map<std::string, ScopeStats> scopes;
    std::vector<OpenScope> openScopes;
    bool enabled = true;

    Profiler() = default;
    static Profiler& instance();

    void printScope(std::ostream& os,
                    const std::string& name,
                    const std::string& indent,
                    bool last,
                    Duration rootTotal) const;
};

/**
 * @brief RAII scope: begins on construction, ends on destruction
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string scopeName;
    bool active;
};

} // namespace Profiling

#define BOXIGON_PROFILE_CONCAT_INNER(a, b) a##b
#define BOXIGON_PROFILE_CONCAT(a, b) BOXIGON_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing scope under @p name
 */
#define BOXIGON_PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler BOXIGON_PROFILE_CONCAT(boxigonScopedProfiler, __LINE__) { name }
