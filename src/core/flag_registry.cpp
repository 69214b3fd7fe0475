#include "flagpole/core/flag_registry.h"
#include "flagpole/utils/logging.hpp"
#include <algorithm>
#include <exception>
#include <utility>

namespace flagpole {
namespace core {

namespace {

std::string keyText(const std::optional<std::string>& key) {
    return key ? "'" + *key + "'" : std::string("<merge>");
}

} // namespace

FlagRegistry::FlagRegistry(const FlagSpace& space, const nlohmann::json& config)
    : space_(space) {
    config_ = {
        {"duplicate_trigger_policy", "error"},
        {"pass_full_structure", false},
        {"log_level", nullptr}
    };
    configure(config);
}

BindingHandle FlagRegistry::registerHandler(FlagMask flag,
                                            SingleHandler handler,
                                            const std::optional<std::string>& key,
                                            FlagMask dependsOn) {
    if (!isSingleFlag(flag)) {
        throw ConfigurationError(
            "Handler must be registered against a single flag, got " + space_.describe(flag));
    }
    if (!handler) {
        throw ConfigurationError("Handler for " + space_.describe(flag) + " is empty");
    }

    std::vector<BindingEntry> entries{BindingEntry{flag, key, dependsOn, 0}};
    return addBinding(std::move(entries), dependsOn, std::move(handler));
}

BindingHandle FlagRegistry::registerMultiHandler(
    const std::vector<FlagMask>& flags,
    const std::vector<std::optional<std::string>>& keys,
    MultiHandler handler,
    FlagMask dependsOn) {
    if (flags.empty()) {
        throw ConfigurationError("Multi-output handler needs at least one flag");
    }
    if (flags.size() != keys.size()) {
        throw ConfigurationError(
            "Multi-output handler has " + std::to_string(flags.size()) + " flags but " +
            std::to_string(keys.size()) + " keys");
    }
    if (!handler) {
        throw ConfigurationError("Multi-output handler is empty");
    }

    std::vector<BindingEntry> entries;
    FlagMask seen = 0;
    for (std::size_t i = 0; i < flags.size(); ++i) {
        if (!isSingleFlag(flags[i])) {
            throw ConfigurationError(
                "Handler must be registered against single flags, got " +
                space_.describe(flags[i]));
        }
        if (seen & flags[i]) {
            throw ConfigurationError(
                "Flag " + space_.describe(flags[i]) + " listed twice in one registration");
        }
        seen |= flags[i];
        entries.push_back(BindingEntry{flags[i], keys[i], dependsOn, i});
    }
    return addBinding(std::move(entries), dependsOn, std::move(handler));
}

BindingHandle FlagRegistry::addBinding(std::vector<BindingEntry> entries, FlagMask dependsOn,
                                       HandlerBinding::Callable callable) {
    claimFlags(entries);

    BindingHandle handle{nextId_++};
    for (const auto& entry : entries) {
        FLAGPOLE_LOG_DEBUG("Registered {} -> {} (binding {}, depends on {})",
                           space_.describe(entry.flag), keyText(entry.key), handle.id,
                           space_.describe(dependsOn));
    }
    bindings_.emplace_back(handle, std::move(entries), dependsOn, std::move(callable));
    return handle;
}

void FlagRegistry::claimFlags(const std::vector<BindingEntry>& entries) {
    FlagMask claimed = 0;
    for (const auto& entry : entries) {
        claimed |= entry.flag;
    }

    std::vector<BindingHandle> owners = bindingsMatching(claimed);
    if (owners.empty()) {
        return;
    }

    if (duplicatePolicy_ == DuplicatePolicy::ERROR) {
        FlagMask taken = 0;
        for (const auto& owner : owners) {
            taken |= get(owner).triggerMask() & claimed;
        }
        throw ConfigurationError("Flag " + space_.describe(taken) + " already has a handler");
    }

    for (auto it = bindings_.begin(); it != bindings_.end();) {
        FlagMask overlap = it->triggerMask() & claimed;
        if (!overlap) {
            ++it;
            continue;
        }
        FLAGPOLE_LOG_WARN("Replacing handler for {} (binding {})",
                          space_.describe(overlap), it->handle().id);

        bool hasEntries = true;
        for (FlagMask bit = 1; bit != 0 && bit <= overlap; bit <<= 1) {
            if (overlap & bit) {
                hasEntries = it->removeFlag(bit);
            }
        }
        it = hasEntries ? it + 1 : bindings_.erase(it);
    }
}

nlohmann::json FlagRegistry::build(FlagMask requested, const BuildOptions& options) const {
    nlohmann::json result = nlohmann::json::object();
    build(requested, result, options);
    return result;
}

nlohmann::json FlagRegistry::build(FlagMask requested, nlohmann::json&& startWith,
                                   const BuildOptions& options) const {
    build(requested, startWith, options);
    return std::move(startWith);
}

nlohmann::json& FlagRegistry::build(FlagMask requested, nlohmann::json& startWith,
                                    const BuildOptions& options) const {
    if (!startWith.is_null() && !startWith.is_object()) {
        throw ConfigurationError(
            "Result structure must be an object, got " + std::string(startWith.type_name()));
    }
    if (!options.kwargs.is_object()) {
        throw ConfigurationError(
            "Keyword arguments must be an object, got " + std::string(options.kwargs.type_name()));
    }

    // Resolution throws before any handler runs, so startWith stays untouched
    BuildPlan buildPlan = plan(requested);
    if (startWith.is_null()) {
        startWith = nlohmann::json::object();
    }
    bool passStructure = options.passFullStructure.value_or(passFullStructure_);

    for (const auto& handle : buildPlan.order) {
        const HandlerBinding& binding = get(handle);
        bool withStructure = passStructure || binding.dependsOn() != 0;

        HandlerCall call{withStructure ? &startWith : nullptr, options.args, options.kwargs};

        FLAGPOLE_LOG_DEBUG("Running handler for {} (binding {})",
                           space_.describe(binding.triggerMask()), handle.id);
        try {
            binding.invoke(call, buildPlan.effectiveFlags, startWith);
        } catch (const std::exception& e) {
            FLAGPOLE_LOG_ERROR("Handler for {} failed: {}",
                               space_.describe(binding.triggerMask()), e.what());
            throw;
        }
    }
    return startWith;
}

BuildPlan FlagRegistry::plan(FlagMask requested) const {
    DependencyResolver resolver(space_, bindings_);
    return resolver.resolve(requested);
}

FlagMask FlagRegistry::resolveFlags(FlagMask requested) const {
    return plan(requested).effectiveFlags;
}

FlagMask FlagRegistry::dependencyFlag(BindingHandle handle) const {
    DependencyResolver resolver(space_, bindings_);
    return resolver.dependencyFlag(indexOf(handle));
}

std::vector<BindingHandle> FlagRegistry::bindingsMatching(FlagMask mask) const {
    std::vector<BindingHandle> handles;
    for (const auto& binding : bindings_) {
        if (binding.triggerMask() & mask) {
            handles.push_back(binding.handle());
        }
    }
    return handles;
}

FlagMask FlagRegistry::bindingFlag(BindingHandle handle) const {
    return get(handle).triggerMask();
}

FlagMask FlagRegistry::bindingDependencies(BindingHandle handle) const {
    return get(handle).dependsOn();
}

const std::vector<BindingEntry>& FlagRegistry::entries(BindingHandle handle) const {
    return get(handle).entries();
}

Result<void> FlagRegistry::check() const {
    FlagMask provided = 0;
    for (const auto& binding : bindings_) {
        if (!space_.covers(binding.triggerMask())) {
            return Result<void>::failure(
                "Binding " + std::to_string(binding.handle().id) +
                " is triggered by undeclared bits " +
                space_.describe(binding.triggerMask() & ~space_.all()));
        }
        provided |= binding.triggerMask();
    }

    try {
        // Requesting every provided flag walks every binding
        plan(provided);
    } catch (const FlagError& e) {
        return Result<void>::failure(e.what());
    }
    return Result<void>();
}

void FlagRegistry::configure(const nlohmann::json& config) {
    if (config.is_null()) {
        return;
    }
    if (!config.is_object()) {
        throw ConfigurationError("Registry configuration must be an object");
    }

    // Validate every recognized key before applying any of them
    DuplicatePolicy policy = duplicatePolicy_;
    bool passFullStructure = passFullStructure_;
    std::optional<std::string> logLevel;

    if (config.contains("duplicate_trigger_policy")) {
        const auto& value = config["duplicate_trigger_policy"];
        if (value == "error") {
            policy = DuplicatePolicy::ERROR;
        } else if (value == "replace") {
            policy = DuplicatePolicy::REPLACE;
        } else {
            throw ConfigurationError(
                "duplicate_trigger_policy must be \"error\" or \"replace\", got " + value.dump());
        }
    }
    if (config.contains("pass_full_structure")) {
        const auto& value = config["pass_full_structure"];
        if (!value.is_boolean()) {
            throw ConfigurationError("pass_full_structure must be a boolean, got " + value.dump());
        }
        passFullStructure = value.get<bool>();
    }
    if (config.contains("log_level")) {
        const auto& value = config["log_level"];
        if (!value.is_string() || !utils::isLogLevel(value.get<std::string>())) {
            throw ConfigurationError("log_level must be a spdlog level name, got " + value.dump());
        }
        logLevel = value.get<std::string>();
    }

    duplicatePolicy_ = policy;
    passFullStructure_ = passFullStructure;
    config_["duplicate_trigger_policy"] = policy == DuplicatePolicy::REPLACE ? "replace" : "error";
    config_["pass_full_structure"] = passFullStructure;
    if (logLevel) {
        utils::setLogLevel(*logLevel);
        config_["log_level"] = *logLevel;
    }
}

const HandlerBinding* FlagRegistry::find(BindingHandle handle) const {
    // Ids grow with registration order and removal keeps the order
    auto it = std::lower_bound(
        bindings_.begin(), bindings_.end(), handle,
        [](const HandlerBinding& binding, BindingHandle h) { return binding.handle() < h; });
    if (it == bindings_.end() || it->handle() != handle) {
        return nullptr;
    }
    return &*it;
}

const HandlerBinding& FlagRegistry::get(BindingHandle handle) const {
    const HandlerBinding* binding = find(handle);
    if (!binding) {
        throw ConfigurationError("Unknown binding handle " + std::to_string(handle.id));
    }
    return *binding;
}

std::size_t FlagRegistry::indexOf(BindingHandle handle) const {
    return static_cast<std::size_t>(&get(handle) - bindings_.data());
}

} // namespace core
} // namespace flagpole
