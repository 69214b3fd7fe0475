#pragma once

#include "flagpole/core/flag_space.h"
#include "flagpole/core/handler_binding.h"
#include <cstddef>
#include <vector>

namespace flagpole {
namespace core {

/**
 * @brief Outcome of resolving a requested flag combination.
 */
struct BuildPlan {
    FlagMask requestedFlags{0};            ///< Flags passed by the caller
    FlagMask effectiveFlags{0};            ///< Requested flags plus transitive dependency flags
    std::vector<BindingHandle> order;      ///< Bindings to execute, dependencies first
};

/**
 * @brief Resolves which bindings a build needs and in what order.
 *
 * The resolver works on a snapshot of the registry's bindings, stored in
 * registration order. Edges run from a binding to every binding whose
 * trigger flags intersect its dependency mask, so a dependency on a
 * composite flag is satisfied only once every binding reachable from that
 * flag has run.
 *
 * Resolution happens in four steps:
 * 1. Selection: bindings whose trigger flags intersect the request.
 * 2. Closure: dependencies of selected bindings are pulled in transitively,
 *    whether or not their flags were requested.
 * 3. Cycle detection: depth-first search over the closure. A cycle aborts
 *    the resolution before anything runs.
 * 4. Ordering: Kahn's algorithm, always taking the earliest registered
 *    binding among those whose dependencies are done.
 *
 * Time Complexity: O(n^2) in the number of bindings, which is bounded by
 * FlagSpace::MAX_FLAGS.
 */
class DependencyResolver {
public:
    /**
     * @param space Flag space the bindings were declared against
     * @param bindings Bindings in registration order; must outlive the resolver
     */
    DependencyResolver(const FlagSpace& space, const std::vector<HandlerBinding>& bindings);

    DependencyResolver(FlagSpace&&, const std::vector<HandlerBinding>&) = delete;
    DependencyResolver(const FlagSpace&, std::vector<HandlerBinding>&&) = delete;
    DependencyResolver(FlagSpace&&, std::vector<HandlerBinding>&&) = delete;

    /**
     * @brief Computes the execution plan for a flag combination.
     *
     * @throws UnknownFlagError if the request uses undeclared bits, or a
     *         walked binding triggers on an undeclared bit or depends on a
     *         flag no binding provides
     * @throws CircularDependencyError if the walked bindings form a cycle
     */
    BuildPlan resolve(FlagMask requested) const;

    /**
     * @brief Transitive dependency mask of the binding at index.
     *
     * @throws UnknownFlagError, CircularDependencyError as for resolve()
     */
    FlagMask dependencyFlag(std::size_t index) const;

    /// Indices of bindings whose trigger flags intersect mask, in registration order
    std::vector<std::size_t> providersOf(FlagMask mask) const;

private:
    enum class VisitState { UNVISITED, IN_PROGRESS, DONE };

    void validateBinding(std::size_t index) const;

    /// Indices reachable from seeds through dependency edges, seeds included
    std::vector<std::size_t> closure(std::vector<std::size_t> seeds) const;

    void detectCycles(const std::vector<std::size_t>& nodes) const;

    void visit(std::size_t index, std::vector<VisitState>& state,
               std::vector<std::size_t>& path) const;

    void reportCycle(const std::vector<std::size_t>& path,
                     std::size_t start) const;

    std::vector<std::size_t> topologicalOrder(const std::vector<std::size_t>& nodes) const;

    const FlagSpace& space_;
    const std::vector<HandlerBinding>& bindings_;
    FlagMask providedFlags_{0};
};

} // namespace core
} // namespace flagpole
