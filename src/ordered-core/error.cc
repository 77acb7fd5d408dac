#include "error.hh"

#include <ordered-core/macros.hh>
#include <ordered-core/utility.hh>

char const* oc::to_string(error_kind kind)
{
    switch (kind)
    {
    case error_kind::allocation_failure:
        return "allocation_failure";
    case error_kind::duplicate_key:
        return "duplicate_key";
    case error_kind::key_not_found:
        return "key_not_found";
    }

    OC_BUILTIN_UNREACHABLE;
}

oc::error oc::error::create_allocation_failure(isize requested_bytes, oc::source_location site)
{
    return error{
        .kind = error_kind::allocation_failure,
        .message = "memory resource could not provide " + std::to_string(requested_bytes) + " bytes",
        .index = -1,
        .site = site,
    };
}

oc::error oc::error::create_duplicate_key(isize sorted_index, oc::source_location site)
{
    return error{
        .kind = error_kind::duplicate_key,
        .message = "entry " + std::to_string(sorted_index) + " (in key order) repeats the key of its predecessor",
        .index = sorted_index,
        .site = site,
    };
}

oc::error oc::error::create_key_not_found(oc::source_location site)
{
    return error{
        .kind = error_kind::key_not_found,
        .message = "key is not present",
        .index = -1,
        .site = site,
    };
}

std::string oc::error::to_string() const
{
    std::string result;

    result += "error: ";
    result += oc::to_string(kind);
    result += ": ";
    result += message;
    result += "\n  at ";
    result += site.file_name();
    result += ":";
    result += std::to_string(site.line());
    result += " - ";
    result += site.function_name();

    return result;
}

oc::error_exception::error_exception(oc::error err) : _error(oc::move(err)), _what(_error.to_string()) {}

char const* oc::error_exception::what() const noexcept
{
    return _what.c_str();
}

void oc::impl::throw_error(oc::error err)
{
    throw oc::error_exception(oc::move(err));
}
