#ifndef UNICSV_SIMD_HIGHWAY_H
#define UNICSV_SIMD_HIGHWAY_H

// Portable SIMD helpers using Google Highway

#include <cstddef>
#include <cstdint>
#include "common_defs.h"

// Include Highway for portable SIMD
#undef HWY_TARGET_INCLUDE
#include "hwy/highway.h"

namespace unicsv {

// Namespace alias for Highway operations
namespace hn = hwy::HWY_NAMESPACE;

// Length of the leading run of ASCII bytes (high bit clear) in [data, data + len).
// Returns len when every byte is ASCII.
HWY_ATTR really_inline size_t ascii_run_length(const uint8_t* data, size_t len) {
  const hn::ScalableTag<uint8_t> d;
  const size_t N = hn::Lanes(d);

  const auto high_bit = hn::Set(d, static_cast<uint8_t>(0x80));
  const auto zero = hn::Zero(d);

  size_t i = 0;
  for (; i + N <= len; i += N) {
    const auto vec = hn::LoadU(d, data + i);
    const auto mask = hn::Ne(hn::And(vec, high_bit), zero);
    const intptr_t first = hn::FindFirstTrue(d, mask);
    if (first >= 0) {
      return i + static_cast<size_t>(first);
    }
  }

  // Handle remaining bytes with scalar code
  for (; i < len; ++i) {
    if (data[i] & 0x80) {
      return i;
    }
  }

  return len;
}

}  // namespace unicsv

#endif  // UNICSV_SIMD_HIGHWAY_H
