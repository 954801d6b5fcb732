#pragma once

#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace scxsync {

struct BuildTarget {
    std::string name;
    std::string output;
    std::vector<std::string> command;
    std::vector<std::string> depends;
    bool build_always_stale{false};
    bool build_by_default{false};
};

struct ChainState {
    std::optional<std::string> tail;
};

// One fold step: target gains a dependency on the current tail, is marked
// always stale and becomes the new tail. Throws std::invalid_argument if
// target is the current tail.
std::pair<BuildTarget, ChainState> chain_target(BuildTarget target, const ChainState& state);

class BuildChainer {
public:
    BuildChainer() = default;

    // Throws std::invalid_argument if a target of that name is already chained.
    const BuildTarget& add(BuildTarget target);

    // Depends on the final tail only and is built by default.
    BuildTarget aggregate(const std::string& name) const;

    const std::vector<BuildTarget>& targets() const { return targets_; }
    const ChainState& state() const { return state_; }

private:
    std::vector<BuildTarget> targets_;
    ChainState state_;
    std::set<std::string> names_;
};

// Transitive closure of the dependencies of `name`, excluding `name` itself.
// Throws std::invalid_argument on an unknown target.
std::set<std::string> transitive_dependencies(const std::vector<BuildTarget>& targets,
                                              const std::string& name);

const std::vector<std::string>& default_rust_schedulers();

BuildTarget cargo_scheduler_target(const std::string& sched);

void write_declarations(std::ostream& out, const std::vector<BuildTarget>& targets);

} // namespace scxsync
