#ifndef UNICSV_COMMON_DEFS_H
#define UNICSV_COMMON_DEFS_H

#include <cstddef>

// Code points pulled from the source in one Highway-scanned ASCII run.
// Large enough to amortise the vector setup, small enough to stay in L1.
#define UNICSV_ASCII_RUN 256

#ifdef _MSC_VER

#define really_inline inline
#define never_inline __declspec(noinline)

#ifndef likely
#define likely(x) x
#endif
#ifndef unlikely
#define unlikely(x) x
#endif

#else

#define really_inline inline __attribute__((always_inline, unused))
#define never_inline inline __attribute__((noinline, unused))

#ifndef likely
#define likely(x) __builtin_expect(!!(x), 1)
#endif
#ifndef unlikely
#define unlikely(x) __builtin_expect(!!(x), 0)
#endif

#endif  // _MSC_VER

#endif // UNICSV_COMMON_DEFS_H
