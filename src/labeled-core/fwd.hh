#pragma once

#include <cstddef>
#include <cstdint>


namespace lc
{

//
// Primitives
//

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

// floating point
using f32 = float;
using f64 = double;

// signed size type
// We use signed i64 for sizes and indices instead of size_t,
// "size - 1" and friends must not silently wrap around.
using isize = i64;

//
// Vocabulary types
//

struct nullopt_t;
template <class T>
struct optional;

template <class T, class E>
struct result;

//
// Labels
//

template <isize N>
struct fixed_string;

struct unit;

//
// Labeled unions
//

template <class T, class... Labels>
struct outcome;

template <class... Labels>
struct failures;

//
// Generation
//

struct seed;

template <class T>
struct arbitrary;
template <class T>
struct coarbitrary;

} // namespace lc
