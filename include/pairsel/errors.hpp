#pragma once

/// @file include/pairsel/errors.hpp
/// @brief Error taxonomy raised by pipeline stages.
///
/// Numerical primitives report undefined results through `std::optional`.
/// Pipeline stages report violated preconditions by throwing `PipelineError`,
/// synchronously, at the point of the violation. Nothing is retried and no
/// stage continues with partial state.

#include <stdexcept>
#include <string>
#include <string_view>

namespace pairsel {

/// Category of a pipeline failure.
enum class ErrorKind {
    InvalidInput,  ///< Absent, empty or malformed input
    NotReady,      ///< A prerequisite stage has not produced its output
    NoCandidates,  ///< A filter received no pairs, or a stage found none
};

/// Stable name of an error kind ("InvalidInput", ...).
[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// Exception thrown by pipeline stages.
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace pairsel
