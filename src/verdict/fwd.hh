#pragma once

#include <cstddef>
#include <cstdint>


namespace vd
{

//
// Primitives
//

// signed size type, same reasoning as in most of our libraries:
// sizes and indices are signed so that "size - 1" and friends never wrap around
using i64 = int64_t;
using isize = i64;

//
// Result
//

struct unit;

template <class T>
struct as_success_t;
template <class T>
struct as_failure_t;

template <class S, class F>
struct result;
template <class S, class F>
struct failure_projection;

template <class F>
struct failure_traits;

//
// Error detail
//

struct error_entry;
struct error_detail;

} // namespace vd
