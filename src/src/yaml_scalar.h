#pragma once

#include <od/value.h>

#include <string>

namespace od {
namespace yaml {
namespace detail {

// Type an unquoted scalar: null, bool, integer, float, otherwise string.
Value plain_scalar(const std::string& text);

} // namespace detail
} // namespace yaml
} // namespace od
