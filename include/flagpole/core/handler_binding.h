#pragma once

#include "flagpole/core/flag_errors.h"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace flagpole {
namespace core {

/**
 * @brief Arguments handed to a handler by FlagRegistry::build.
 */
struct HandlerCall {
    /// Result structure built so far. Set when the build passes the full
    /// structure or when the binding has dependencies, null otherwise.
    const nlohmann::json* structure;
    const std::vector<nlohmann::json>& args;   ///< Positional pass-through arguments
    const nlohmann::json& kwargs;              ///< Keyword pass-through arguments (object)

    bool hasStructure() const { return structure != nullptr; }
};

/// Handler producing a single value
using SingleHandler = std::function<nlohmann::json(const HandlerCall&)>;

/// Handler producing one value per registered flag, positionally aligned
using MultiHandler = std::function<std::vector<nlohmann::json>(const HandlerCall&)>;

/**
 * @brief Opaque identifier of a registered binding.
 */
struct BindingHandle {
    std::size_t id{0};

    bool operator==(const BindingHandle& other) const { return id == other.id; }
    bool operator!=(const BindingHandle& other) const { return id != other.id; }
    bool operator<(const BindingHandle& other) const { return id < other.id; }
};

/**
 * @brief One (trigger flag, output key) slot of a binding.
 */
struct BindingEntry {
    FlagMask flag{0};                 ///< Single trigger bit
    std::optional<std::string> key;   ///< Output key, nullopt merges the value as an object
    FlagMask dependsOn{0};            ///< Dependency mask of the owning binding
    std::size_t returnIndex{0};       ///< Position in a multi-valued return
};

/**
 * @brief Registered association of trigger flags, output keys, dependencies
 *        and a callable.
 *
 * A binding is either single-output (one entry, SingleHandler) or
 * multi-output (one entry per returned value, MultiHandler). Entries can be
 * removed when another registration takes over their flag; the return index
 * of the remaining entries is unaffected.
 */
class HandlerBinding {
public:
    using Callable = std::variant<SingleHandler, MultiHandler>;

    HandlerBinding(BindingHandle handle, std::vector<BindingEntry> entries,
                   FlagMask dependsOn, Callable callable);

    BindingHandle handle() const { return handle_; }
    const std::vector<BindingEntry>& entries() const { return entries_; }
    FlagMask dependsOn() const { return dependsOn_; }
    bool isMultiOutput() const { return std::holds_alternative<MultiHandler>(callable_); }

    /// OR of the trigger flags of all entries
    FlagMask triggerMask() const { return triggerMask_; }

    /// Number of values a multi-output handler is expected to return
    std::size_t returnArity() const { return returnArity_; }

    /**
     * @brief Drops the entry for flag.
     *
     * @return true if the binding still has entries afterwards
     */
    bool removeFlag(FlagMask flag);

    /**
     * @brief Invokes the callable and merges the values whose flag is in
     *        effectiveFlags into result.
     *
     * @throws MergeError if a value cannot be merged
     * @note Exceptions thrown by the callable propagate unchanged.
     */
    void invoke(const HandlerCall& call, FlagMask effectiveFlags,
                nlohmann::json& result) const;

private:
    static void mergeValue(const BindingEntry& entry, nlohmann::json value,
                           nlohmann::json& result);

    BindingHandle handle_;
    std::vector<BindingEntry> entries_;
    FlagMask dependsOn_;
    FlagMask triggerMask_{0};
    std::size_t returnArity_{0};
    Callable callable_;
};

} // namespace core
} // namespace flagpole
