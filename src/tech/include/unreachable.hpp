#pragma once

#include "fxr_config.hpp"

namespace fxr {

[[noreturn]] FXR_ALWAYS_INLINE void unreachable() {
#if defined(__GNUC__)
  __builtin_unreachable();
#elif defined(FXR_MSVC)
  __assume(0);
#else
#error "To be implemented"
#endif
}

}  // namespace fxr
