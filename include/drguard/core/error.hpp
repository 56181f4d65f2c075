#pragma once
/**
 * @file error.hpp
 * @brief Error codes and the expected-style result type used across the core.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "drguard/compat/expected.hpp"

namespace drguard {

/**
 * @enum ErrorCode
 * @brief Failure classes surfaced at component boundaries.
 */
enum class ErrorCode : std::uint8_t {
    InvalidArgument = 1,  ///< Caller supplied inconsistent input
    InvalidConfig,        ///< Configuration failed validation
    UnknownStore,         ///< Lag sample for a store that was never registered
    OutOfOrder,           ///< Lag sample older than the newest accepted sample
    PlanInProgress,       ///< A cutover plan is already non-terminal
    PlanCommitted,        ///< Cancellation refused: a side-effecting step completed
    NoActivePlan,         ///< Operation needs an in-flight plan
    NoSafeTarget,         ///< Target region is not affirmatively safe
    InvalidTransition,    ///< Operator request not valid in the current mode
    AutomationHalted,     ///< A previous cutover failed and awaits acknowledgement
    BackendFailure,       ///< External storage/routing/workflow call failed
    Timeout,              ///< Bounded wait expired
    Io,                   ///< Persistence read/write failed
    Parse                 ///< Persisted or configured document could not be parsed
};

/**
 * @struct Error
 * @brief Error code plus a human-readable detail for logs and operators.
 */
struct Error {
    ErrorCode   code{ErrorCode::InvalidArgument};
    std::string message;
};

template <class T>
using Result = drguard_detail::expected<T, Error>;

/// Convenience constructor for the error branch of a Result.
inline drguard_detail::unexpected<Error> make_error(ErrorCode code, std::string message) {
    return drguard_detail::unexpected<Error>(Error{code, std::move(message)});
}

std::string_view to_string(ErrorCode c) noexcept;

} // namespace drguard
