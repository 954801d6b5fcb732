#include "build_chain.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace scxsync {

namespace {

void write_list(std::ostream& out, const std::vector<std::string>& items) {
    out << '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) {
            out << ", ";
        }
        out << '\'' << items[i] << '\'';
    }
    out << ']';
}

} // namespace

std::pair<BuildTarget, ChainState> chain_target(BuildTarget target, const ChainState& state) {
    if (state.tail && *state.tail == target.name) {
        throw std::invalid_argument("Build target chained after itself: " + target.name);
    }
    if (state.tail) {
        auto& deps = target.depends;
        if (std::find(deps.begin(), deps.end(), *state.tail) == deps.end()) {
            deps.push_back(*state.tail);
        }
    }
    target.build_always_stale = true;

    ChainState next{target.name};
    return {std::move(target), std::move(next)};
}

const BuildTarget& BuildChainer::add(BuildTarget target) {
    if (!names_.insert(target.name).second) {
        throw std::invalid_argument("Build target already chained: " + target.name);
    }
    auto step = chain_target(std::move(target), state_);
    state_ = std::move(step.second);
    targets_.push_back(std::move(step.first));
    return targets_.back();
}

BuildTarget BuildChainer::aggregate(const std::string& name) const {
    BuildTarget all;
    all.name = name;
    all.output = name + ".__PHONY__";
    all.command = {"touch", all.output};
    if (state_.tail) {
        all.depends.push_back(*state_.tail);
    }
    all.build_by_default = true;
    return all;
}

std::set<std::string> transitive_dependencies(const std::vector<BuildTarget>& targets,
                                              const std::string& name) {
    std::map<std::string, const BuildTarget*> by_name;
    for (const auto& target : targets) {
        by_name[target.name] = &target;
    }

    auto root = by_name.find(name);
    if (root == by_name.end()) {
        throw std::invalid_argument("Unknown build target: " + name);
    }

    std::set<std::string> seen;
    std::vector<const BuildTarget*> pending{root->second};
    while (!pending.empty()) {
        const BuildTarget* current = pending.back();
        pending.pop_back();

        for (const auto& dep : current->depends) {
            if (!seen.insert(dep).second) {
                continue;
            }
            auto it = by_name.find(dep);
            if (it != by_name.end()) {
                pending.push_back(it->second);
            }
        }
    }

    seen.erase(name);
    return seen;
}

const std::vector<std::string>& default_rust_schedulers() {
    // Build order of the chain.
    static const std::vector<std::string> scheds{
        "scx_layered", "scx_rusty", "scx_rustland", "scx_rlfifo", "scx_asdf", "scx_bpfland", "scx_lavd",
    };
    return scheds;
}

BuildTarget cargo_scheduler_target(const std::string& sched) {
    BuildTarget target;
    target.name = sched;
    target.output = sched;
    target.command = {"cargo", "build", "--release", "--manifest-path", sched + "/Cargo.toml"};
    return target;
}

void write_declarations(std::ostream& out, const std::vector<BuildTarget>& targets) {
    for (const auto& target : targets) {
        out << "custom_target('" << target.name << "',\n"
            << "              output: '" << target.output << "',\n"
            << "              command: ";
        write_list(out, target.command);
        out << ",\n              depends: ";
        write_list(out, target.depends);
        if (target.build_always_stale) {
            out << ",\n              build_always_stale: true";
        }
        if (target.build_by_default) {
            out << ",\n              build_by_default: true";
        }
        out << ")\n";
    }
}

} // namespace scxsync
