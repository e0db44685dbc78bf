#pragma once

#include <amc/smallvector.hpp>
#include <cstdint>
#include <memory>

namespace fxr {

template <class T, uint32_t N, class Alloc = std::allocator<T>>
using SmallVector = amc::SmallVector<T, N, Alloc>;

}  // namespace fxr
