/**
 * @file profile.cpp
 * @brief Scope tree bookkeeping for profile.hpp
 */

#include "boxigon/core/profile.hpp"
#include "boxigon/core/debug.hpp"

#include <algorithm>
#include <iomanip>
#include <utility>

namespace Profiling {

Profiler& Profiler::instance() {
    static Profiler profiler;
    return profiler;
}

void Profiler::begin(const std::string& name) {
    auto& self = instance();
    auto& stats = self.scopes[name];

    if (!self.openScopes.empty()) {
        const std::string& parent = self.openScopes.back().name;
        if (stats.parent != parent) {
            // Re-parent: a scope lives under the last parent it was opened in
            if (!stats.parent.empty()) {
                auto& siblings = self.scopes[stats.parent].children;
                siblings.erase(std::remove(siblings.begin(), siblings.end(), name), siblings.end());
            }
            stats.parent = parent;
        }
        auto& children = self.scopes[parent].children;
        if (std::find(children.begin(), children.end(), name) == children.end()) {
            children.push_back(name);
        }
    } else if (!stats.parent.empty()) {
        auto& siblings = self.scopes[stats.parent].children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), name), siblings.end());
        stats.parent.clear();
    }

    self.openScopes.push_back({name, Clock::now()});
}

void Profiler::end(const std::string& name) {
    auto& self = instance();
    if (self.openScopes.empty() || self.openScopes.back().name != name) {
        BOXIGON_WARN("Profiler", "end(\"" << name << "\") does not match the innermost open scope");
        return;
    }

    Duration const elapsed = std::chrono::duration_cast<Duration>(
        Clock::now() - self.openScopes.back().started);
    self.openScopes.pop_back();

    auto& stats = self.scopes[name];
    stats.total += elapsed;
    stats.self += elapsed;
    stats.calls += 1;
    stats.shortest = std::min(stats.shortest, elapsed);
    stats.longest = std::max(stats.longest, elapsed);

    if (!stats.parent.empty()) {
        self.scopes[stats.parent].self -= elapsed;
    }
}

const Profiler::ScopeStats* Profiler::find(const std::string& name) {
    auto& self = instance();
    auto it = self.scopes.find(name);
    return it == self.scopes.end() ? nullptr : &it->second;
}

void Profiler::printStats(std::ostream& os) {
    const auto& self = instance();

    std::vector<std::string> roots;
    Duration rootTotal{0};
    for (const auto& [name, stats] : self.scopes) {
        if (stats.parent.empty()) {
            roots.push_back(name);
            rootTotal += stats.total;
        }
    }

    os << "\nProfiling Statistics:\n";
    for (std::size_t i = 0; i < roots.size(); ++i) {
        self.printScope(os, roots[i], "", i + 1 == roots.size(), rootTotal);
    }
}

void Profiler::printScope(std::ostream& os,
                          const std::string& name,
                          const std::string& indent,
                          bool last,
                          Duration rootTotal) const
{
    const auto& stats = scopes.at(name);

    double totalPct = 0.0;
    double selfPct = 0.0;
    if (rootTotal.count() > 0) {
        totalPct = 100.0 * static_cast<double>(stats.total.count()) / static_cast<double>(rootTotal.count());
        selfPct = 100.0 * static_cast<double>(stats.self.count()) / static_cast<double>(rootTotal.count());
    }
    double const totalMs = static_cast<double>(stats.total.count()) / 1.0e6;
    double const avgUs = stats.calls > 0
        ? static_cast<double>(stats.total.count()) / 1.0e3 / static_cast<double>(stats.calls)
        : 0.0;

    os << indent << (last ? "└── " : "├── ")
       << name << " [" << stats.calls << " calls] "
       << std::fixed << std::setprecision(2) << totalMs << "ms, avg " << avgUs << "us"
       << " (total: " << totalPct << "%, self: " << selfPct << "%)\n";

    std::string const childIndent = indent + (last ? "    " : "│   ");
    for (std::size_t i = 0; i < stats.children.size(); ++i) {
        printScope(os, stats.children[i], childIndent, i + 1 == stats.children.size(), rootTotal);
    }
}

void Profiler::reset() {
    auto& self = instance();
    self.scopes.clear();
    self.openScopes.clear();
}

void Profiler::setEnabled(bool enabled) {
    instance().enabled = enabled;
}

bool Profiler::isEnabled() {
    return instance().enabled;
}

ScopedProfiler::ScopedProfiler(std::string name)
    : scopeName(std::move(name))
    , active(Profiler::isEnabled())
{
    if (active) {
        Profiler::begin(scopeName);
    }
}

ScopedProfiler::~ScopedProfiler() {
    if (active) {
        Profiler::end(scopeName);
    }
}

} // namespace Profiling
