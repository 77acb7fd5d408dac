#pragma once

#include <source_location>

namespace oc
{
/// Type alias for std::source_location
/// Captured by assertions and attached to every oc::error as the failing call site.
/// Usage:
///   oc::error make_error(oc::source_location site = oc::source_location::current());
using source_location = std::source_location;
} // namespace oc
