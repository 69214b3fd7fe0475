#pragma once
#include <string>
#include <utility>

namespace flagpole {
namespace utils {

// Outcome of an operation that reports failure as a message instead of
// throwing. Used by the non-throwing validation entry points.
template <typename T>
class Result;

template <>
class Result<void> {
public:
    Result() : success_(true) {}

    static Result failure(std::string error) {
        Result result;
        result.success_ = false;
        result.error_ = std::move(error);
        return result;
    }

    bool has_value() const { return success_; }
    bool has_error() const { return !success_; }
    explicit operator bool() const { return success_; }
    const std::string& error() const { return error_; }

private:
    bool success_ = false;
    std::string error_;
};

} // namespace utils

using utils::Result;

} // namespace flagpole
