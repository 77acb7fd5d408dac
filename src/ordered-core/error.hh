#pragma once

#include <ordered-core/fwd.hh>
#include <ordered-core/macros.hh>
#include <ordered-core/source_location.hh>

#include <exception>
#include <string>

// Error vocabulary of ordered-core
//
// Expected failures travel as oc::result<T> (E = oc::error) from the try_* APIs and from bulk construction.
// The throwing convenience APIs (insert, reserve, shrink_to, at, create_from_or_throw) raise the same
// oc::error wrapped in an oc::error_exception.
// Contract violations never become an oc::error; they are OC_ASSERTs.

/// Category of a recoverable container failure.
enum class oc::error_kind
{
    /// The memory resource could not provide (or resize to) the requested number of bytes.
    allocation_failure,
    /// Bulk construction found two entries with equivalent keys.
    duplicate_key,
    /// An access that requires presence (ordered_map::at) did not find the key.
    key_not_found,
};

namespace oc
{
/// Stable lowercase name of the kind, e.g. "duplicate_key"
[[nodiscard]] char const* to_string(error_kind kind);
} // namespace oc

/// A recoverable container failure: what went wrong, where it was detected, and for
/// duplicate_key the position (in sorted order) of the second of the two equivalent keys.
struct oc::error
{
    error_kind kind = error_kind::allocation_failure;
    std::string message;
    /// Index of the offending entry, or -1 when the failure is not about a specific entry.
    isize index = -1;
    /// Where the failure was detected.
    oc::source_location site;

    // factories
public:
    [[nodiscard]] static error create_allocation_failure(isize requested_bytes,
                                                         oc::source_location site = oc::source_location::current());
    [[nodiscard]] static error create_duplicate_key(isize sorted_index,
                                                    oc::source_location site = oc::source_location::current());
    [[nodiscard]] static error create_key_not_found(oc::source_location site = oc::source_location::current());

    // queries
public:
    [[nodiscard]] bool is(error_kind k) const { return kind == k; }

    /// Renders "error: <kind>: <message>\n  at <file>:<line> - <function>"
    [[nodiscard]] std::string to_string() const;
};

/// Exception thrown by the throwing container APIs.
/// Carries the full oc::error; what() is its to_string().
struct oc::error_exception : std::exception
{
    explicit error_exception(oc::error err);

    [[nodiscard]] char const* what() const noexcept override;
    [[nodiscard]] oc::error const& get_error() const { return _error; }
    [[nodiscard]] error_kind kind() const { return _error.kind; }

private:
    oc::error _error;
    std::string _what;
};

namespace oc::impl
{
/// Throws oc::error_exception(err). Kept out of line so container fast paths stay small.
[[noreturn]] OC_COLD_FUNC void throw_error(oc::error err);
} // namespace oc::impl
