#pragma once

#include <cstdint>
#include <iterator>
#include <limits>

namespace fxr {

/// constexpr and integral version of math.power for base 10.
/// Returns std::numeric_limits<int64_t>::max() for exponents not representable on 64 bits.
constexpr int64_t ipow10(uint8_t exp) noexcept {
  constexpr int64_t kPow10Table[] = {1LL,
                                     10LL,
                                     100LL,
                                     1000LL,
                                     10000LL,
                                     100000LL,
                                     1000000LL,
                                     10000000LL,
                                     100000000LL,
                                     1000000000LL,
                                     10000000000LL,
                                     100000000000LL,
                                     1000000000000LL,
                                     10000000000000LL,
                                     100000000000000LL,
                                     1000000000000000LL,
                                     10000000000000000LL,
                                     100000000000000000LL,
                                     1000000000000000000LL};
  return exp < std::size(kPow10Table) ? kPow10Table[exp] : std::numeric_limits<int64_t>::max();
}

}  // namespace fxr
