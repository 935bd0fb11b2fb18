#pragma once

// Formatting entry points shared by the library. spdlog already depends on fmt, so the
// library formats through the same fmt build instead of <format>.
#include <spdlog/fmt/fmt.h>

namespace bsplink {
using fmt::format;
using fmt::format_to;
using fmt::vformat;
} // namespace bsplink
