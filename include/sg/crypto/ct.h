#pragma once
#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <span>

namespace sg::crypto::ct {

template <size_t N>
inline bool CompareEqual(const std::array<uint8_t, N>& a,
                         const std::array<uint8_t, N>& b) noexcept {
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < N; ++i)
    diff |= (a[i] ^ b[i]);
  return diff == 0;
}

// Length mismatch is folded into the result without an early exit.
inline bool CompareEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
  const size_t n = std::max(a.size(), b.size());
  volatile uint8_t diff = static_cast<uint8_t>(a.size() != b.size());
  for (size_t i = 0; i < n; ++i) {
    const uint8_t av = i < a.size() ? a[i] : 0;
    const uint8_t bv = i < b.size() ? b[i] : 0;
    diff |= static_cast<uint8_t>(av ^ bv);
  }
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

} // namespace sg::crypto::ct
