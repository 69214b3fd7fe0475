#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace flagpole {
namespace core {

/**
 * @brief Bitmask type used for flags and flag combinations
 */
using FlagMask = std::uint64_t;

/**
 * @brief Error codes for flag resolution failures
 */
enum class FlagErrorCode : uint8_t {
    CONFIGURATION = 0x01,
    UNKNOWN_FLAG = 0x02,
    CIRCULAR_DEPENDENCY = 0x03,
    MERGE = 0x04
};

/**
 * @brief Base class for every error raised by the resolution engine
 *
 * Exceptions thrown by registered handlers are not wrapped in this type.
 */
class FlagError : public std::runtime_error {
public:
    FlagError(const std::string& message, FlagErrorCode code)
        : std::runtime_error(message), error_code_(code) {}

    FlagErrorCode getErrorCode() const { return error_code_; }

private:
    FlagErrorCode error_code_;
};

/**
 * @brief Malformed flag space declaration, registration or configuration
 */
class ConfigurationError : public FlagError {
public:
    explicit ConfigurationError(const std::string& message)
        : FlagError(message, FlagErrorCode::CONFIGURATION) {}
};

/**
 * @brief Reference to a flag name or value that does not exist
 */
class UnknownFlagError : public FlagError {
public:
    UnknownFlagError(const std::string& message, std::string flagName, FlagMask mask = 0)
        : FlagError(message, FlagErrorCode::UNKNOWN_FLAG)
        , flag_name_(std::move(flagName))
        , mask_(mask) {}

    /// Name that failed to resolve, or the rendered mask for value lookups
    const std::string& getFlagName() const { return flag_name_; }

    /// Offending bits, 0 for name lookups
    FlagMask getMask() const { return mask_; }

private:
    std::string flag_name_;
    FlagMask mask_;
};

/**
 * @brief Dependency cycle among the bindings selected for a build
 */
class CircularDependencyError : public FlagError {
public:
    CircularDependencyError(const std::string& message, std::vector<std::string> flags)
        : FlagError(message, FlagErrorCode::CIRCULAR_DEPENDENCY)
        , flags_(std::move(flags)) {}

    /// Trigger flags of the bindings on the cycle, in dependency order
    const std::vector<std::string>& getFlags() const { return flags_; }

private:
    std::vector<std::string> flags_;
};

/**
 * @brief A handler returned a value that cannot be merged into the result
 */
class MergeError : public FlagError {
public:
    explicit MergeError(const std::string& message)
        : FlagError(message, FlagErrorCode::MERGE) {}
};

} // namespace core
} // namespace flagpole
