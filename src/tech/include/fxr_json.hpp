#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export

namespace fxr {

namespace json {
using glz::error_ctx;
using glz::format_error;
using glz::meta;
using glz::opts;
using glz::read;
using glz::write;
}  // namespace json

}  // namespace fxr
