#pragma once

#include <cstddef>
#include <cstdint>


namespace rc
{

//
// Primitives
//

// Explicitly-sized primitive types
// Used wherever the range matters for correctness or memory layout (slab freemaps, handles).
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
// Sizes and indices are signed throughout ring-core:
// * "size - 1" on an empty list must not wrap around to a huge positive number
// * a negative index is simply out of bounds instead of silently becoming a valid one
// * mixed signed/unsigned comparisons are avoided entirely
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Vocabulary types
//

struct nullopt_t;
template <class T>
struct optional;

template <class E>
struct as_error_t;
template <class T, class E>
struct result;

//
// Nodes
//

enum class node_handle : u32;
template <class NodeT>
struct node_pool;

//
// Container
//

enum class list_error : u8;
template <class T>
struct ring_node;
template <class T>
struct ring_list;

} // namespace rc
