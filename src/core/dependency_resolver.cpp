#include "flagpole/core/dependency_resolver.h"
#include "flagpole/utils/logging.hpp"
#include <algorithm>
#include <set>

namespace flagpole {
namespace core {

DependencyResolver::DependencyResolver(const FlagSpace& space,
                                       const std::vector<HandlerBinding>& bindings)
    : space_(space)
    , bindings_(bindings) {
    for (const auto& binding : bindings_) {
        providedFlags_ |= binding.triggerMask();
    }
}

BuildPlan DependencyResolver::resolve(FlagMask requested) const {
    if (!space_.covers(requested)) {
        FlagMask unknown = requested & ~space_.all();
        throw UnknownFlagError(
            "Requested flags contain undeclared bits " + space_.describe(unknown),
            space_.describe(unknown), unknown);
    }

    std::vector<std::size_t> selected = providersOf(requested);
    std::vector<std::size_t> nodes = closure(selected);
    detectCycles(nodes);

    BuildPlan plan;
    plan.requestedFlags = requested;
    plan.effectiveFlags = requested;
    for (std::size_t index : nodes) {
        plan.effectiveFlags |= bindings_[index].dependsOn();
    }
    for (std::size_t index : topologicalOrder(nodes)) {
        plan.order.push_back(bindings_[index].handle());
    }

    FLAGPOLE_LOG_DEBUG("Resolved {} to {} binding(s), effective flags {}",
                       space_.describe(requested), plan.order.size(),
                       space_.describe(plan.effectiveFlags));
    return plan;
}

FlagMask DependencyResolver::dependencyFlag(std::size_t index) const {
    std::vector<std::size_t> nodes = closure({index});
    detectCycles(nodes);

    FlagMask dependencies = 0;
    for (std::size_t node : nodes) {
        dependencies |= bindings_[node].dependsOn();
    }
    return dependencies;
}

std::vector<std::size_t> DependencyResolver::providersOf(FlagMask mask) const {
    std::vector<std::size_t> result;
    for (std::size_t i = 0; i < bindings_.size(); ++i) {
        if (bindings_[i].triggerMask() & mask) {
            result.push_back(i);
        }
    }
    return result;
}

void DependencyResolver::validateBinding(std::size_t index) const {
    const HandlerBinding& binding = bindings_[index];

    if (!space_.covers(binding.triggerMask())) {
        FlagMask unknown = binding.triggerMask() & ~space_.all();
        throw UnknownFlagError(
            "Binding " + std::to_string(binding.handle().id) +
            " is triggered by undeclared bits " + space_.describe(unknown),
            space_.describe(unknown), unknown);
    }

    FlagMask missing = binding.dependsOn() & ~providedFlags_;
    if (missing) {
        throw UnknownFlagError(
            "Binding for " + space_.describe(binding.triggerMask()) +
            " depends on " + space_.describe(missing) +
            " which no registered handler provides",
            space_.describe(missing), missing);
    }
}

std::vector<std::size_t> DependencyResolver::closure(std::vector<std::size_t> seeds) const {
    std::vector<bool> included(bindings_.size(), false);
    for (std::size_t seed : seeds) {
        included[seed] = true;
    }

    std::vector<std::size_t> pending = std::move(seeds);
    while (!pending.empty()) {
        std::size_t index = pending.back();
        pending.pop_back();
        validateBinding(index);

        FlagMask dependsOn = bindings_[index].dependsOn();
        if (!dependsOn) {
            continue;
        }
        for (std::size_t provider : providersOf(dependsOn)) {
            if (!included[provider]) {
                included[provider] = true;
                pending.push_back(provider);
            }
        }
    }

    std::vector<std::size_t> nodes;
    for (std::size_t i = 0; i < included.size(); ++i) {
        if (included[i]) {
            nodes.push_back(i);
        }
    }
    return nodes;
}

void DependencyResolver::detectCycles(const std::vector<std::size_t>& nodes) const {
    std::vector<VisitState> state(bindings_.size(), VisitState::UNVISITED);
    std::vector<std::size_t> path;
    for (std::size_t index : nodes) {
        if (state[index] == VisitState::UNVISITED) {
            visit(index, state, path);
        }
    }
}

void DependencyResolver::visit(std::size_t index, std::vector<VisitState>& state,
                               std::vector<std::size_t>& path) const {
    state[index] = VisitState::IN_PROGRESS;
    path.push_back(index);

    FlagMask dependsOn = bindings_[index].dependsOn();
    if (dependsOn) {
        for (std::size_t provider : providersOf(dependsOn)) {
            if (state[provider] == VisitState::IN_PROGRESS) {
                reportCycle(path, provider);
            }
            if (state[provider] == VisitState::UNVISITED) {
                visit(provider, state, path);
            }
        }
    }

    path.pop_back();
    state[index] = VisitState::DONE;
}

void DependencyResolver::reportCycle(const std::vector<std::size_t>& path,
                                     std::size_t start) const {
    auto first = std::find(path.begin(), path.end(), start);

    std::vector<std::string> flags;
    std::string chain;
    for (auto it = first; it != path.end(); ++it) {
        flags.push_back(space_.describe(bindings_[*it].triggerMask()));
        chain += flags.back() + " -> ";
    }
    chain += space_.describe(bindings_[start].triggerMask());

    FLAGPOLE_LOG_ERROR("Circular dependency between bindings: {}", chain);
    throw CircularDependencyError("Circular Dependency Error: " + chain, std::move(flags));
}

std::vector<std::size_t> DependencyResolver::topologicalOrder(
    const std::vector<std::size_t>& nodes) const {
    // Number of unfinished dependencies per node, and the reverse edges
    std::vector<std::size_t> remaining(bindings_.size(), 0);
    std::vector<std::vector<std::size_t>> dependents(bindings_.size());

    for (std::size_t index : nodes) {
        FlagMask dependsOn = bindings_[index].dependsOn();
        if (!dependsOn) {
            continue;
        }
        for (std::size_t provider : providersOf(dependsOn)) {
            dependents[provider].push_back(index);
            ++remaining[index];
        }
    }

    // Ordered by index, so ties are broken by registration order
    std::set<std::size_t> ready;
    for (std::size_t index : nodes) {
        if (remaining[index] == 0) {
            ready.insert(index);
        }
    }

    std::vector<std::size_t> order;
    order.reserve(nodes.size());
    while (!ready.empty()) {
        std::size_t index = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(index);

        for (std::size_t dependent : dependents[index]) {
            if (--remaining[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }
    return order;
}

} // namespace core
} // namespace flagpole
