#pragma once

#include "flagpole/core/dependency_resolver.h"
#include "flagpole/core/flag_space.h"
#include "flagpole/core/handler_binding.h"
#include "flagpole/utils/result.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace flagpole {
namespace core {

/**
 * @brief What happens when a trigger flag is registered a second time.
 */
enum class DuplicatePolicy {
    ERROR,    ///< Reject the registration with ConfigurationError
    REPLACE   ///< The new registration takes the flag, a warning is logged
};

/**
 * @brief Per-call options of FlagRegistry::build.
 */
struct BuildOptions {
    // Not an aggregate, so a braced start structure never converts to options
    explicit BuildOptions() = default;

    std::vector<nlohmann::json> args;                     ///< Positional pass-through arguments
    nlohmann::json kwargs = nlohmann::json::object();     ///< Keyword pass-through arguments
    /// Pass the result structure to every handler. Falls back to the
    /// registry's "pass_full_structure" setting when unset.
    std::optional<bool> passFullStructure;
};

/**
 * @brief Maps capability flags to handlers and builds results from them.
 *
 * Handlers are registered against one or more flags of a FlagSpace, with an
 * optional output key and optional dependency flags:
 * ```cpp
 * FlagSpace flags{"BASE", "LISTENERS", "RULES"};
 * FlagRegistry registry(flags);
 *
 * registry.registerHandler(flags["LISTENERS"], getListeners, "listeners");
 * registry.registerHandler(flags["RULES"], getRules, "rules", flags["LISTENERS"]);
 *
 * nlohmann::json alb = {{"Arn", "abc"}};
 * registry.build(flags["RULES"], alb);   // runs getListeners, then getRules
 * ```
 *
 * Dependencies are not checked at registration time since they may be
 * registered in any order; unknown dependencies and cycles are reported by
 * build().
 *
 * Thread safety: build() does not modify the registry, so concurrent builds
 * are safe as long as no thread registers or configures at the same time.
 */
class FlagRegistry {
public:
    /**
     * @brief Creates an empty registry.
     *
     * @param space Flag space for all registrations; must outlive the registry
     * @param config Optional configuration, see configure()
     */
    explicit FlagRegistry(const FlagSpace& space,
                          const nlohmann::json& config = nlohmann::json::object());

    // The registry keeps a reference to the space
    FlagRegistry(FlagSpace&& space, const nlohmann::json& config = nlohmann::json::object()) = delete;

    /**
     * @brief Registers a single-output handler.
     *
     * @param flag Single trigger flag
     * @param handler Callable producing the value for flag
     * @param key Output key; without one the returned object is merged into
     *            the result key by key
     * @param dependsOn Flags whose handlers must run first
     * @return Handle of the new binding
     * @throws ConfigurationError if flag is not a single bit, or if it is
     *         already bound and the duplicate policy is ERROR
     */
    BindingHandle registerHandler(FlagMask flag,
                                  SingleHandler handler,
                                  const std::optional<std::string>& key = std::nullopt,
                                  FlagMask dependsOn = FlagSpace::NONE);

    /**
     * @brief Registers a handler that returns one value per flag.
     *
     * Value i of the handler's return is stored under keys[i] when flags[i]
     * was requested, and dropped otherwise.
     *
     * @throws ConfigurationError if flags is empty, flags and keys differ in
     *         length, a flag is not a single bit or repeats, or a flag is
     *         already bound and the duplicate policy is ERROR
     */
    BindingHandle registerMultiHandler(const std::vector<FlagMask>& flags,
                                       const std::vector<std::optional<std::string>>& keys,
                                       MultiHandler handler,
                                       FlagMask dependsOn = FlagSpace::NONE);

    /**
     * @brief Runs the handlers needed for requested and returns a new result.
     *
     * @throws UnknownFlagError, CircularDependencyError before any handler runs
     * @throws MergeError if a handler returns an unmergeable value
     * @note Handler exceptions propagate unchanged; handlers that already ran
     *       keep their merged output.
     */
    nlohmann::json build(FlagMask requested, const BuildOptions& options = BuildOptions()) const;

    /**
     * @brief Runs the handlers needed for requested, merging into startWith.
     *
     * @param startWith Result structure to mutate; null is promoted to an
     *                  empty object
     * @return startWith
     * @throws ConfigurationError if startWith is neither an object nor null
     */
    nlohmann::json& build(FlagMask requested, nlohmann::json& startWith,
                          const BuildOptions& options = BuildOptions()) const;

    /**
     * @brief Runs the handlers needed for requested, merging into a
     *        temporary start structure.
     *
     * Allows `registry.build(flags.all(), {{"Arn", "abc"}})`.
     *
     * @return the merged structure
     */
    nlohmann::json build(FlagMask requested, nlohmann::json&& startWith,
                         const BuildOptions& options = BuildOptions()) const;

    /**
     * @brief Resolves requested without running anything.
     *
     * @throws UnknownFlagError, CircularDependencyError
     */
    BuildPlan plan(FlagMask requested) const;

    /// Requested flags widened by the transitive dependency flags of the selected bindings
    FlagMask resolveFlags(FlagMask requested) const;

    /// Transitive dependency mask of a binding
    FlagMask dependencyFlag(BindingHandle handle) const;

    /// Handles of bindings whose trigger flags intersect mask, in registration order
    std::vector<BindingHandle> bindingsMatching(FlagMask mask) const;

    /// OR of the trigger flags of a binding
    FlagMask bindingFlag(BindingHandle handle) const;

    /// Dependency mask a binding was registered with
    FlagMask bindingDependencies(BindingHandle handle) const;

    /// Entries of a binding in return order
    const std::vector<BindingEntry>& entries(BindingHandle handle) const;

    bool contains(BindingHandle handle) const { return find(handle) != nullptr; }

    /**
     * @brief Validates every registered binding without throwing.
     *
     * @return error describing the first unknown dependency or cycle found
     */
    Result<void> check() const;

    /**
     * @brief Merges recognized keys into the configuration.
     *
     * Recognized keys:
     * - "duplicate_trigger_policy": "error" or "replace"
     * - "pass_full_structure": default for BuildOptions::passFullStructure
     * - "log_level": level of the library logger
     *
     * @throws ConfigurationError on invalid values
     */
    void configure(const nlohmann::json& config);

    const nlohmann::json& config() const { return config_; }

    DuplicatePolicy duplicatePolicy() const { return duplicatePolicy_; }

    const FlagSpace& space() const { return space_; }

    std::size_t size() const { return bindings_.size(); }
    bool empty() const { return bindings_.empty(); }

private:
    BindingHandle addBinding(std::vector<BindingEntry> entries, FlagMask dependsOn,
                             HandlerBinding::Callable callable);

    void claimFlags(const std::vector<BindingEntry>& entries);

    const HandlerBinding* find(BindingHandle handle) const;
    const HandlerBinding& get(BindingHandle handle) const;
    std::size_t indexOf(BindingHandle handle) const;

    const FlagSpace& space_;
    std::vector<HandlerBinding> bindings_;   // registration order
    std::size_t nextId_{1};
    DuplicatePolicy duplicatePolicy_{DuplicatePolicy::ERROR};
    bool passFullStructure_{false};
    nlohmann::json config_;
};

} // namespace core
} // namespace flagpole
