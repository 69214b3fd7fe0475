#include "flagpole/core/flag_space.h"
#include <sstream>

namespace flagpole {
namespace core {

namespace {

const char* const kAllName = "ALL";
const char* const kNoneName = "NONE";
// Accepted for callers that spell it the way most languages spell null
const char* const kNoneAlias = "None";

bool isReservedName(const std::string& name) {
    return name == kAllName || name == kNoneName || name == kNoneAlias;
}

std::string toHex(FlagMask mask) {
    std::ostringstream out;
    out << "0x" << std::hex << mask;
    return out.str();
}

} // namespace

FlagSpace::FlagSpace(std::vector<std::string> names)
    : names_(std::move(names)) {
    if (names_.empty()) {
        throw ConfigurationError("Flag space must declare at least one flag");
    }
    if (names_.size() > MAX_FLAGS) {
        throw ConfigurationError(
            "Flag space declares " + std::to_string(names_.size()) +
            " flags, at most " + std::to_string(MAX_FLAGS) + " are supported");
    }

    FlagMask bit = 1;
    for (const auto& name : names_) {
        if (name.empty()) {
            throw ConfigurationError("Flag names must not be empty");
        }
        if (isReservedName(name)) {
            throw ConfigurationError("Flag name '" + name + "' is reserved");
        }
        if (!values_.emplace(name, bit).second) {
            throw ConfigurationError("Duplicate flag name '" + name + "'");
        }
        all_ |= bit;
        bit <<= 1;
    }
}

FlagSpace FlagSpace::fromJson(const nlohmann::json& config) {
    const nlohmann::json* list = &config;
    if (config.is_object()) {
        auto it = config.find("flags");
        if (it == config.end()) {
            throw ConfigurationError("Flag space configuration requires a 'flags' array");
        }
        list = &*it;
    }
    if (!list->is_array()) {
        throw ConfigurationError("Flag space configuration must be an array of names");
    }

    std::vector<std::string> names;
    names.reserve(list->size());
    for (const auto& entry : *list) {
        if (!entry.is_string()) {
            throw ConfigurationError("Flag names must be strings, got " + entry.dump());
        }
        names.push_back(entry.get<std::string>());
    }
    return FlagSpace(std::move(names));
}

FlagMask FlagSpace::valueOf(const std::string& name) const {
    if (name == kAllName) {
        return all_;
    }
    if (name == kNoneName || name == kNoneAlias) {
        return NONE;
    }
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw UnknownFlagError("Unknown flag '" + name + "'", name);
    }
    return it->second;
}

bool FlagSpace::contains(const std::string& name) const {
    return isReservedName(name) || values_.count(name) > 0;
}

const std::string& FlagSpace::nameOf(FlagMask flag) const {
    if (!isSingleFlag(flag) || !covers(flag)) {
        throw UnknownFlagError("No flag with value " + toHex(flag), toHex(flag), flag);
    }
    std::size_t index = 0;
    while ((flag >> index) != 1) {
        ++index;
    }
    return names_[index];
}

std::string FlagSpace::describe(FlagMask mask) const {
    if (mask == NONE) {
        return kNoneName;
    }

    std::string text;
    for (std::size_t i = 0; i < names_.size(); ++i) {
        if (mask & (FlagMask{1} << i)) {
            if (!text.empty()) {
                text += '|';
            }
            text += names_[i];
        }
    }

    FlagMask unknown = mask & ~all_;
    if (unknown) {
        if (!text.empty()) {
            text += '|';
        }
        text += toHex(unknown);
    }
    return text;
}

std::string FlagSpace::toString() const {
    std::ostringstream out;
    out << '{';
    for (std::size_t i = 0; i < names_.size(); ++i) {
        out << names_[i] << ": " << (FlagMask{1} << i) << ", ";
    }
    out << kAllName << ": " << all_ << ", "
        << kNoneAlias << ": " << NONE << ", "
        << kNoneName << ": " << NONE << '}';
    return out.str();
}

nlohmann::json FlagSpace::toJson() const {
    nlohmann::json members = nlohmann::json::object();
    for (std::size_t i = 0; i < names_.size(); ++i) {
        members[names_[i]] = FlagMask{1} << i;
    }
    members[kAllName] = all_;
    members[kNoneAlias] = NONE;
    members[kNoneName] = NONE;
    return members;
}

} // namespace core
} // namespace flagpole
