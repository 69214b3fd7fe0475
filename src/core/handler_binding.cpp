#include "flagpole/core/handler_binding.h"
#include <algorithm>

namespace flagpole {
namespace core {

HandlerBinding::HandlerBinding(BindingHandle handle, std::vector<BindingEntry> entries,
                               FlagMask dependsOn, Callable callable)
    : handle_(handle)
    , entries_(std::move(entries))
    , dependsOn_(dependsOn)
    , callable_(std::move(callable)) {
    for (const auto& entry : entries_) {
        triggerMask_ |= entry.flag;
        returnArity_ = std::max(returnArity_, entry.returnIndex + 1);
    }
}

bool HandlerBinding::removeFlag(FlagMask flag) {
    entries_.erase(
        std::remove_if(entries_.begin(), entries_.end(),
                       [flag](const BindingEntry& entry) { return entry.flag == flag; }),
        entries_.end());
    triggerMask_ &= ~flag;
    return !entries_.empty();
}

void HandlerBinding::invoke(const HandlerCall& call, FlagMask effectiveFlags,
                            nlohmann::json& result) const {
    if (const auto* single = std::get_if<SingleHandler>(&callable_)) {
        nlohmann::json value = (*single)(call);
        // A single-output binding has at most one entry
        for (const auto& entry : entries_) {
            if (effectiveFlags & entry.flag) {
                mergeValue(entry, std::move(value), result);
            }
        }
        return;
    }

    const auto& multi = std::get<MultiHandler>(callable_);
    std::vector<nlohmann::json> values = multi(call);
    if (values.size() < returnArity_) {
        throw MergeError(
            "Binding " + std::to_string(handle_.id) + " returned " +
            std::to_string(values.size()) + " values, expected " +
            std::to_string(returnArity_));
    }

    for (const auto& entry : entries_) {
        // Values for flags that were not requested are dropped
        if (effectiveFlags & entry.flag) {
            mergeValue(entry, std::move(values[entry.returnIndex]), result);
        }
    }
}

void HandlerBinding::mergeValue(const BindingEntry& entry, nlohmann::json value,
                                nlohmann::json& result) {
    if (entry.key) {
        result[*entry.key] = std::move(value);
        return;
    }

    if (value.is_null()) {
        return;
    }
    if (!value.is_object()) {
        throw MergeError(
            "Value without an output key must be an object, got " +
            std::string(value.type_name()));
    }
    for (auto it = value.begin(); it != value.end(); ++it) {
        result[it.key()] = std::move(it.value());
    }
}

} // namespace core
} // namespace flagpole
