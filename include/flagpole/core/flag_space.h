#pragma once

#include "flagpole/core/flag_errors.h"
#include <cstddef>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace flagpole {
namespace core {

/**
 * @brief Immutable set of named capability flags.
 *
 * Each declared name owns one bit, assigned in declaration order: the first
 * name gets 1, the second 2, the third 4 and so on. Two synthetic members are
 * always available:
 * - NONE (also spelled "None") with value 0
 * - ALL with every declared bit set
 *
 * Flags are combined by the caller with ordinary bitwise operators:
 * ```cpp
 * FlagSpace flags{"BASE", "LISTENERS", "RULES"};
 * FlagMask wanted = flags["BASE"] | flags["RULES"];
 * ```
 *
 * A FlagSpace is cheap to copy and never changes after construction, so one
 * instance can be shared by reference across any number of registries.
 */
class FlagSpace {
public:
    /// Maximum number of declared names (bit width of FlagMask)
    static constexpr std::size_t MAX_FLAGS = 64;

    static constexpr FlagMask NONE = 0;

    /**
     * @brief Declares a flag space.
     *
     * @param names Distinct, non-empty names in bit order
     * @throws ConfigurationError if names is empty, has duplicates, uses a
     *         reserved name (ALL, NONE, None) or exceeds MAX_FLAGS
     */
    explicit FlagSpace(std::vector<std::string> names);

    FlagSpace(std::initializer_list<std::string> names)
        : FlagSpace(std::vector<std::string>(names)) {}

    /**
     * @brief Declares a flag space from JSON.
     *
     * Accepts either an array of names or an object with a "flags" array.
     *
     * @throws ConfigurationError on any other shape or on invalid names
     */
    static FlagSpace fromJson(const nlohmann::json& config);

    /**
     * @brief Looks up the value of a flag by name.
     *
     * "ALL", "NONE" and "None" always resolve.
     *
     * @throws UnknownFlagError if the name is not declared
     */
    FlagMask valueOf(const std::string& name) const;

    FlagMask operator[](const std::string& name) const { return valueOf(name); }

    /// True for declared names and the synthetic members
    bool contains(const std::string& name) const;

    /**
     * @brief Reverse lookup of a single declared bit.
     *
     * @throws UnknownFlagError if flag is not exactly one declared bit
     */
    const std::string& nameOf(FlagMask flag) const;

    /**
     * @brief Renders a mask as "A|B". Bits outside the space are appended in
     *        hex, an empty mask renders as "NONE".
     */
    std::string describe(FlagMask mask) const;

    /// Declared names in bit order, without the synthetic members
    const std::vector<std::string>& names() const { return names_; }

    std::size_t size() const { return names_.size(); }

    FlagMask all() const { return all_; }
    FlagMask none() const { return NONE; }

    /// True if mask only uses declared bits
    bool covers(FlagMask mask) const { return (mask & ~all_) == 0; }

    /**
     * @brief Lists every member, declared names first, then ALL, None, NONE.
     *
     * Example: {BASE: 1, FEATURE_ONE: 2, ALL: 3, None: 0, NONE: 0}
     */
    std::string toString() const;

    /// Same members as toString(), as a JSON object
    nlohmann::json toJson() const;

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, FlagMask> values_;
    FlagMask all_{0};
};

/// True if flag has exactly one bit set
inline bool isSingleFlag(FlagMask flag) {
    return flag != 0 && (flag & (flag - 1)) == 0;
}

} // namespace core
} // namespace flagpole
