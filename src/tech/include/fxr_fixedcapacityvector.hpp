#pragma once

#include <amc/fixedcapacityvector.hpp>
#include <cstdint>

namespace fxr {

template <class T, uint32_t N>
using FixedCapacityVector = amc::FixedCapacityVector<T, N>;

}  // namespace fxr
