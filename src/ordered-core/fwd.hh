#pragma once

#include <cstddef>
#include <cstdint>


namespace oc
{

//
// Primitives
//

// Explicitly-sized primitive types
// Used wherever the range matters for correctness or memory layout.
// Plain "int" is fine for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes, indices and capacities are signed i64 throughout:
// * "size - 1" on an empty container is -1, not a huge positive number
// * no mixed signed/unsigned arithmetic in the binary search and shifting code
// * -1 is available as an error sentinel (memory_resource uses it for failed allocations)
// * we only target 64-bit platforms, so the range is plenty
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;
template <class T>
struct raw_parts;

//
// Views
//

template <class T>
struct span;
template <class T>
struct strided_iterator;
template <class T>
struct strided_span;

//
// Vocabulary
//

struct nullopt_t;
template <class T>
struct optional;

template <class K, class V>
struct entry;

enum class error_kind;
struct error;
struct error_exception;
// E defaults to oc::error for every result returned by the containers
template <class T, class E = error>
struct result;

//
// Containers
//

struct search_result;

template <class T, class KeyOf, class ContainerT>
struct ordered_container;

template <class K, class V>
struct ordered_map;
template <class T>
struct ordered_set;

} // namespace oc
